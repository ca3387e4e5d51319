#include "sqlchain/materializer/object_rows.hpp"

namespace sqlchain::materializer::detail {

std::string reading_command_text(const execution::ExecutionToken& token)
{
    for (const auto* current = &token; current != nullptr; current = current->next()) {
        if (current->reads_rows()) {
            return current->command_text();
        }
    }
    return token.command_text();
}

}  // namespace sqlchain::materializer::detail
