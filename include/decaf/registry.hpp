#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace decaf {

    inline constexpr std::string_view decompile_tool_name{"decompile"};

    struct tool_descriptor {
        std::string name{};
        std::string description{};
        // JSON Schema object describing the tool arguments
        std::string input_schema{};
    };

    // Fixed set of tools; built once at startup and never mutated.
    class tool_registry {
      public:
        tool_registry();

        const std::vector<tool_descriptor>& list_tools() const noexcept { return tools_; }

        const tool_descriptor* find(std::string_view name) const noexcept;

      private:
        std::vector<tool_descriptor> tools_{};
    };

}  // namespace decaf
