#include "evaluator/intellisense.hpp"

#include <algorithm>
#include <vector>
#include "evaluator/interpreter.hpp"
#include "evaluator/lexer.hpp"

namespace crucible::evaluator {

using nlohmann::json;

namespace {

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

const BuiltinInfo* find_builtin(const std::string& name) {
    for (const auto& builtin : builtin_functions()) {
        if (builtin.name == name) {
            return &builtin;
        }
    }
    return nullptr;
}

json completion(const std::string& prefix, const json& context) {
    std::vector<json> items;
    for (const auto& binding : context.items()) {
        if (starts_with(binding.key(), prefix)) {
            items.push_back(json{{"label", binding.key()}, {"kind", "variable"},
                                 {"detail", render_value(binding.value())}});
        }
    }
    for (const auto& builtin : builtin_functions()) {
        if (starts_with(builtin.name, prefix)) {
            items.push_back(json{{"label", builtin.name}, {"kind", "function"},
                                 {"detail", builtin.signature}});
        }
    }
    std::sort(items.begin(), items.end(), [](const json& a, const json& b) {
        return a["label"].get<std::string>() < b["label"].get<std::string>();
    });
    return json{{"items", items}};
}

json details(const std::string& identifier, const json& context) {
    if (context.contains(identifier)) {
        return json{{"name", identifier}, {"kind", "variable"},
                    {"contents", identifier + " = " + context[identifier].dump()}};
    }
    if (const BuiltinInfo* builtin = find_builtin(identifier)) {
        return json{{"name", identifier}, {"kind", "function"},
                    {"contents", builtin->signature + "\n\n" + builtin->doc}};
    }
    return nullptr;
}

// Finds the innermost call still open at the end of `code`.
json signature(const std::string& code) {
    auto tokens = tokenize(code);
    if (core::errors::is_error(tokens)) {
        return nullptr;
    }

    struct OpenCall {
        std::string name;
        int argument = 0;
    };
    std::vector<OpenCall> open;
    const auto& list = core::errors::get_value(tokens);
    for (std::size_t i = 0; i < list.size(); ++i) {
        const Token& token = list[i];
        if (token.kind == TokenKind::LeftParen) {
            const bool is_call = i > 0 && list[i - 1].kind == TokenKind::Identifier;
            open.push_back(OpenCall{is_call ? list[i - 1].text : "", 0});
        } else if (token.kind == TokenKind::RightParen && !open.empty()) {
            open.pop_back();
        } else if (token.kind == TokenKind::Comma && !open.empty()) {
            ++open.back().argument;
        } else if (token.kind == TokenKind::Separator) {
            open.clear();
        }
    }

    for (auto it = open.rbegin(); it != open.rend(); ++it) {
        if (it->name.empty()) {
            continue;
        }
        const BuiltinInfo* builtin = find_builtin(it->name);
        if (builtin == nullptr) {
            return nullptr;
        }
        return json{{"name", builtin->name}, {"signature", builtin->signature},
                    {"active_argument", it->argument}};
    }
    return nullptr;
}

}  // namespace

core::errors::Result<std::string> format_code(const std::string& code) {
    auto tokens = tokenize(code);
    if (core::errors::is_error(tokens)) {
        return core::errors::get_error(tokens);
    }

    std::vector<std::string> lines;
    std::string line;
    for (const Token& token : core::errors::get_value(tokens)) {
        switch (token.kind) {
            case TokenKind::Separator:
            case TokenKind::End:
                if (!line.empty()) {
                    lines.push_back(line);
                    line.clear();
                }
                break;
            case TokenKind::String:
                line += quote(token.text);
                break;
            case TokenKind::Plus:
                line += " + ";
                break;
            case TokenKind::Assign:
                line += " = ";
                break;
            case TokenKind::Comma:
                line += ", ";
                break;
            default:
                line += token.text;
        }
    }

    std::string formatted;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            formatted += "\n";
        }
        formatted += lines[i];
    }
    return formatted;
}

json handle_intellisense(const protocol::IntellisenseRequest& request, const json& context) {
    const json empty = json::object();
    const json& bindings = context.is_object() ? context : empty;

    switch (request.kind) {
        case protocol::IntellisenseKind::Completion:
            return completion(request.hint, bindings);
        case protocol::IntellisenseKind::Details:
            return details(request.hint, bindings);
        case protocol::IntellisenseKind::Signature:
            return signature(request.hint);
        case protocol::IntellisenseKind::Format: {
            auto formatted = format_code(request.hint);
            if (core::errors::is_error(formatted)) {
                return json{{"error", core::errors::get_error(formatted).message}};
            }
            return json{{"code", core::errors::get_value(formatted)}};
        }
    }
    return nullptr;
}

}  // namespace crucible::evaluator
