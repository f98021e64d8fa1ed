#include "decaf/registry.hpp"

#include <algorithm>

namespace decaf {

    namespace detail {

        static constexpr auto decompile_description =
                R"(Decompile a Java class/JAR using CFR. Use this to view the source code of compiled Java files.)";

        static constexpr auto decompile_input_schema =
                R"json({"type": "object","properties": {"file_path": {"type": "string","description": "Absolute path to the .class or .jar file."},"method_name": {"type": "string","description": "Only decompile methods with this name (highly recommended for large classes)."},"ignore_exceptions": {"type": "boolean","description": "Drop try-catch blocks to make logic clearer (CFR --ignoreexceptions true). Default: false."},"hide_utf": {"type": "boolean","description": "Hide UTF-8 characters if encoding is messy (CFR --hideutf true). Default: false."},"options": {"type": "object","description": "Advanced CFR options (e.g. {\"sugarboxing\": false}). Keys must be alphanumeric; other keys are ignored."}},"required": ["file_path"]})json";

    }  // namespace detail

    tool_registry::tool_registry() {
        tools_.push_back(
                tool_descriptor{
                        .name = std::string{decompile_tool_name},
                        .description = detail::decompile_description,
                        .input_schema = detail::decompile_input_schema,
                });
    }

    const tool_descriptor* tool_registry::find(std::string_view name) const noexcept {
        auto it = std::ranges::find(tools_, name, &tool_descriptor::name);
        return it == tools_.end() ? nullptr : &*it;
    }

}  // namespace decaf
