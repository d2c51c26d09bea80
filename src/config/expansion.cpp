#include "memboot/expansion.hpp"
#include "memboot/platform.hpp"

namespace memboot {

ExpansionResult expand_placeholders(const std::string& input,
                                    const std::unordered_map<std::string, std::string>& variables) {
    ExpansionResult result;

    std::string output;
    output.reserve(input.size());

    size_t placeholder_count = 0;
    size_t i = 0;

    while (i < input.size()) {
        if (input[i] == '$' && i + 1 < input.size() && input[i + 1] == '{') {
            size_t close = input.find('}', i + 2);
            if (close != std::string::npos) {
                std::string name = input.substr(i + 2, close - i - 2);
                if (!name.empty() && name.find('{') == std::string::npos) {
                    if (++placeholder_count > MAX_PLACEHOLDERS) {
                        result.error = "placeholder limit exceeded";
                        return result;
                    }

                    auto it = variables.find(name);
                    if (it != variables.end()) {
                        output += it->second;
                    } else if (auto env = get_env(name)) {
                        output += *env;
                    } else {
                        result.missing.push_back(name);
                    }
                    i = close + 1;
                    continue;
                }
            }
        }
        output += input[i];
        ++i;
    }

    result.ok = true;
    result.value = std::move(output);
    return result;
}

} // namespace memboot
