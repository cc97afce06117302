#include "evaluator/interpreter.hpp"

#include <chrono>
#include <filesystem>
#include <limits>
#include <thread>
#include <unistd.h>
#include "core/errors/crucible_errors.hpp"
#include "evaluator/lexer.hpp"

namespace crucible::evaluator {

using core::errors::CrucibleError;
using core::errors::ErrorCategory;
using core::errors::Result;
using nlohmann::json;

namespace {

// Parses and evaluates in a single pass; builtins run as soon as their call
// is parsed.
class Evaluation {
public:
    Evaluation(const std::vector<Token>& tokens, std::string file, json bindings,
               const EvaluationHooks& hooks)
        : tokens_(tokens), file_(std::move(file)), bindings_(std::move(bindings)),
          hooks_(hooks) {}

    Result<json> run() {
        json last = nullptr;
        while (!check(TokenKind::End)) {
            if (check(TokenKind::Separator)) {
                advance();
                continue;
            }
            auto value = statement();
            if (core::errors::is_error(value)) {
                return value;
            }
            last = core::errors::take_value(value);
            if (!check(TokenKind::Separator) && !check(TokenKind::End)) {
                return syntax_error(peek(), "unexpected '" + describe(peek()) + "'");
            }
        }
        return last;
    }

    json take_bindings() { return std::move(bindings_); }

private:
    Result<json> statement() {
        if (check(TokenKind::Identifier) && next_is(TokenKind::Assign)) {
            const std::string name = advance().text;
            advance();
            auto value = expression();
            if (core::errors::is_error(value)) {
                return value;
            }
            bindings_[name] = core::errors::get_value(value);
            return value;
        }
        return expression();
    }

    Result<json> expression() {
        auto left = term();
        if (core::errors::is_error(left)) {
            return left;
        }
        json value = core::errors::take_value(left);

        while (check(TokenKind::Plus)) {
            const Token& op = advance();
            auto right = term();
            if (core::errors::is_error(right)) {
                return right;
            }
            auto sum = add(op, value, core::errors::get_value(right));
            if (core::errors::is_error(sum)) {
                return sum;
            }
            value = core::errors::take_value(sum);
        }
        return value;
    }

    Result<json> term() {
        const Token& token = advance();
        switch (token.kind) {
            case TokenKind::Integer:
                return json(token.integer);
            case TokenKind::String:
                return json(token.text);
            case TokenKind::LeftParen: {
                auto inner = expression();
                if (core::errors::is_error(inner)) {
                    return inner;
                }
                if (!check(TokenKind::RightParen)) {
                    return syntax_error(peek(), "expected ')'");
                }
                advance();
                return inner;
            }
            case TokenKind::Identifier:
                if (check(TokenKind::LeftParen)) {
                    return call(token);
                }
                if (bindings_.contains(token.text)) {
                    return bindings_[token.text];
                }
                return runtime_error(token, "undefined name '" + token.text + "'");
            default:
                return syntax_error(token, "unexpected '" + describe(token) + "'");
        }
    }

    Result<json> call(const Token& name) {
        advance();  // '('
        std::vector<json> args;
        if (!check(TokenKind::RightParen)) {
            while (true) {
                auto arg = expression();
                if (core::errors::is_error(arg)) {
                    return arg;
                }
                args.push_back(core::errors::take_value(arg));
                if (check(TokenKind::Comma)) {
                    advance();
                    continue;
                }
                break;
            }
        }
        if (!check(TokenKind::RightParen)) {
            return syntax_error(peek(), "expected ')'");
        }
        advance();
        return invoke(name, args);
    }

    Result<json> invoke(const Token& name, const std::vector<json>& args) {
        const BuiltinInfo* builtin = nullptr;
        for (const auto& candidate : builtin_functions()) {
            if (candidate.name == name.text) {
                builtin = &candidate;
                break;
            }
        }
        if (builtin == nullptr) {
            return runtime_error(name, "undefined function '" + name.text + "'");
        }
        if (args.size() != builtin->arity) {
            return runtime_error(name, name.text + "() takes " +
                                           std::to_string(builtin->arity) +
                                           " argument(s), got " + std::to_string(args.size()));
        }

        const std::string& fn = builtin->name;
        if (fn == "print") {
            if (hooks_.on_output) {
                hooks_.on_output(render_value(args[0]) + "\n");
            }
            return json(nullptr);
        }
        if (fn == "str") {
            return json(render_value(args[0]));
        }
        if (fn == "len") {
            if (!args[0].is_string()) {
                return runtime_error(name, "len() expects a string");
            }
            return json(static_cast<std::int64_t>(args[0].get<std::string>().size()));
        }
        if (fn == "os_pid") {
            return json(static_cast<std::int64_t>(::getpid()));
        }
        if (fn == "sleep") {
            if (!args[0].is_number_integer() || args[0].get<std::int64_t>() < 0) {
                return runtime_error(name, "sleep() expects a non-negative integer");
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(args[0].get<std::int64_t>()));
            return json(nullptr);
        }
        if (fn == "wait_for_file") {
            if (!args[0].is_string()) {
                return runtime_error(name, "wait_for_file() expects a path string");
            }
            const std::filesystem::path path = args[0].get<std::string>();
            std::error_code ec;
            while (!std::filesystem::exists(path, ec)) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            return args[0];
        }
        if (fn == "exit") {
            if (!args[0].is_number_integer()) {
                return runtime_error(name, "exit() expects an integer status");
            }
            if (hooks_.on_exit) {
                hooks_.on_exit(static_cast<int>(args[0].get<std::int64_t>()));
            }
            return runtime_error(name, "exit() is not available here");
        }
        return runtime_error(name, "undefined function '" + name.text + "'");
    }

    Result<json> add(const Token& op, const json& left, const json& right) {
        if (left.is_number_integer() && right.is_number_integer()) {
            const auto a = left.get<std::int64_t>();
            const auto b = right.get<std::int64_t>();
            if ((b > 0 && a > std::numeric_limits<std::int64_t>::max() - b) ||
                (b < 0 && a < std::numeric_limits<std::int64_t>::min() - b)) {
                return runtime_error(op, "integer overflow");
            }
            return json(a + b);
        }
        if (left.is_string() && right.is_string()) {
            return json(left.get<std::string>() + right.get<std::string>());
        }
        return runtime_error(op, "cannot add " + type_name(left) + " and " + type_name(right));
    }

    static std::string type_name(const json& value) {
        if (value.is_number_integer()) {
            return "integer";
        }
        if (value.is_string()) {
            return "string";
        }
        if (value.is_null()) {
            return "null";
        }
        return value.type_name();
    }

    static std::string describe(const Token& token) {
        switch (token.kind) {
            case TokenKind::End: return "end of input";
            case TokenKind::Separator: return "end of statement";
            case TokenKind::String: return quote(token.text);
            default: return token.text;
        }
    }

    CrucibleError syntax_error(const Token& at, const std::string& message) const {
        return CrucibleError{ErrorCategory::Input,
                             file_ + ":" + std::to_string(at.line) + ": syntax error: " + message,
                             "syntax_error"};
    }

    CrucibleError runtime_error(const Token& at, const std::string& message) const {
        return CrucibleError{ErrorCategory::Input,
                             file_ + ":" + std::to_string(at.line) + ": " + message,
                             "evaluation_error"};
    }

    const Token& peek() const { return tokens_[position_]; }

    bool check(const TokenKind kind) const { return peek().kind == kind; }

    bool next_is(const TokenKind kind) const {
        return position_ + 1 < tokens_.size() && tokens_[position_ + 1].kind == kind;
    }

    const Token& advance() {
        const Token& token = tokens_[position_];
        if (token.kind != TokenKind::End) {
            ++position_;
        }
        return token;
    }

    const std::vector<Token>& tokens_;
    std::string file_;
    json bindings_;
    const EvaluationHooks& hooks_;
    std::size_t position_ = 0;
};

EvaluationOutcome failed(const std::string& message, const json& context) {
    EvaluationOutcome outcome;
    outcome.result.kind = protocol::ResultKind::Error;
    outcome.result.text = message;
    outcome.bindings = context;
    return outcome;
}

}  // namespace

const std::vector<BuiltinInfo>& builtin_functions() {
    static const std::vector<BuiltinInfo> kBuiltins = {
        {"exit", "exit(status)", "Terminates the evaluator with the given exit status.", 1},
        {"len", "len(text)", "Returns the length of a string.", 1},
        {"os_pid", "os_pid()", "Returns the process id of the evaluator.", 0},
        {"print", "print(value)", "Writes the value followed by a newline to the output.", 1},
        {"sleep", "sleep(milliseconds)", "Pauses the evaluation.", 1},
        {"str", "str(value)", "Converts a value to its text form.", 1},
        {"wait_for_file", "wait_for_file(path)", "Blocks until the file exists.", 1},
    };
    return kBuiltins;
}

EvaluationOutcome evaluate_code(const std::string& code, const std::string& file,
                                const json& context, const EvaluationHooks& hooks) {
    const json start = context.is_object() ? context : json::object();

    auto tokens = tokenize(code);
    if (core::errors::is_error(tokens)) {
        return failed(file + ":" + core::errors::get_error(tokens).message, start);
    }

    Evaluation evaluation(core::errors::get_value(tokens), file, start, hooks);
    auto value = evaluation.run();
    if (core::errors::is_error(value)) {
        return failed(core::errors::get_error(value).message, start);
    }

    EvaluationOutcome outcome;
    outcome.result.kind = protocol::ResultKind::Text;
    outcome.result.text = core::errors::get_value(value).dump();
    outcome.bindings = evaluation.take_bindings();
    return outcome;
}

void merge_missing(json& into, const json& from) {
    if (!into.is_object()) {
        into = json::object();
    }
    if (!from.is_object()) {
        return;
    }
    for (const auto& binding : from.items()) {
        if (!into.contains(binding.key())) {
            into[binding.key()] = binding.value();
        }
    }
}

std::string render_value(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

}  // namespace crucible::evaluator
