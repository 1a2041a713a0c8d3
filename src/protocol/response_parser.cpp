#include "protocol/response_parser.hpp"

#include <array>
#include <sstream>
#include <utility>

namespace tailcall::protocol {

using core::errors::AgentError;
using core::errors::ErrorCategory;

namespace {

constexpr const char* kWhitespace = " \t\r\n\f\v";

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(kWhitespace);
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(kWhitespace);
    return value.substr(first, last - first + 1);
}

// Last occurrence of `needle` lying entirely inside [lo, hi), or npos.
std::size_t rfind_in_range(const std::string& text, const std::string& needle,
                           const std::size_t lo, std::size_t hi) {
    if (hi > text.size()) {
        hi = text.size();
    }
    if (needle.size() > hi || hi - needle.size() < lo) {
        return std::string::npos;
    }
    const std::size_t pos = text.rfind(needle, hi - needle.size());
    if (pos == std::string::npos || pos < lo) {
        return std::string::npos;
    }
    return pos;
}

std::string first_non_blank_line(const std::string& window) {
    std::istringstream in(window);
    std::string line;
    while (std::getline(in, line)) {
        std::string trimmed = trim(line);
        if (!trimmed.empty()) {
            return trimmed;
        }
    }
    return "";
}

AgentError protocol_error(std::string message, std::string code) {
    return AgentError{ErrorCategory::Protocol, std::move(message), std::move(code),
                      "Finish every response with exactly one complete call block."};
}

}  // namespace

ResponseParser::ResponseParser(ProtocolMarkers markers)
    : markers_(std::move(markers)) {}

core::errors::Result<ProtocolMarkers> ResponseParser::validate_markers(
    const ProtocolMarkers& markers) {
    const std::array<const std::string*, 4> all = {
        &markers.begin_call, &markers.end_call, &markers.arg_sep,
        &markers.value_sep};

    for (const auto* marker : all) {
        if (trim(*marker).empty()) {
            return AgentError{ErrorCategory::Input,
                              "Protocol markers must not be blank.",
                              "invalid_protocol_markers"};
        }
    }
    for (std::size_t i = 0; i < all.size(); ++i) {
        for (std::size_t j = 0; j < all.size(); ++j) {
            if (i == j) {
                continue;
            }
            if (all[i]->find(*all[j]) != std::string::npos) {
                return AgentError{ErrorCategory::Input,
                                  "Protocol marker \"" + *all[i] +
                                      "\" overlaps with \"" + *all[j] + "\".",
                                  "invalid_protocol_markers",
                                  "Markers must be distinct and must not contain each other."};
            }
        }
    }
    return markers;
}

core::errors::Result<ResponseParser> ResponseParser::create(ProtocolMarkers markers) {
    auto validated = validate_markers(markers);
    if (core::errors::is_error(validated)) {
        return core::errors::get_error(validated);
    }
    return ResponseParser(std::move(markers));
}

std::string ResponseParser::restore_stop_sequence(const std::string& text) const {
    const std::size_t end_idx = text.rfind(markers_.end_call);
    const std::size_t begin_idx = text.rfind(markers_.begin_call);
    if (begin_idx == std::string::npos) {
        return text;
    }
    if (end_idx != std::string::npos && begin_idx < end_idx) {
        return text;
    }
    std::string restored = text;
    if (!restored.empty() && restored.back() != '\n') {
        restored.push_back('\n');
    }
    return restored + markers_.end_call;
}

core::errors::Result<ParsedCall> ResponseParser::parse(const std::string& text) const {
    const std::size_t end_idx = text.rfind(markers_.end_call);
    if (end_idx == std::string::npos) {
        return protocol_error("END function call marker not found: " + markers_.end_call,
                              "missing_end_marker");
    }

    const std::size_t begin_idx = rfind_in_range(text, markers_.begin_call, 0, end_idx);
    if (begin_idx == std::string::npos) {
        return protocol_error(
            "BEGIN function call marker not found before END marker: " +
                markers_.begin_call,
            "missing_begin_marker");
    }

    ParsedCall call;
    call.thought = trim(text.substr(0, begin_idx));

    const std::size_t content_start = begin_idx + markers_.begin_call.size();
    std::size_t boundary = end_idx;

    while (true) {
        const std::size_t arg_idx =
            rfind_in_range(text, markers_.arg_sep, content_start, boundary);
        if (arg_idx == std::string::npos) {
            break;
        }

        const std::size_t name_start = arg_idx + markers_.arg_sep.size();
        const std::size_t val_idx =
            rfind_in_range(text, markers_.value_sep, name_start, boundary);
        if (val_idx == std::string::npos) {
            return protocol_error(
                "Malformed function call block: " + markers_.arg_sep +
                    " without a following " + markers_.value_sep,
                "malformed_argument_block");
        }

        const std::size_t value_start = val_idx + markers_.value_sep.size();
        std::string arg_name = trim(text.substr(name_start, val_idx - name_start));
        call.arguments[std::move(arg_name)] =
            trim(text.substr(value_start, boundary - value_start));

        boundary = arg_idx;
    }

    call.name = first_non_blank_line(text.substr(content_start, boundary - content_start));
    if (call.name.empty()) {
        return protocol_error("Function name not found in function call block",
                              "missing_function_name");
    }
    return call;
}

std::string ResponseParser::response_template() const {
    std::ostringstream out;
    out << "your_thoughts_here\n"
        << "...\n"
        << markers_.begin_call << "\n"
        << "function_name\n"
        << markers_.arg_sep << "\n"
        << "arg1_name\n"
        << markers_.value_sep << "\n"
        << "arg1_value (can be multiline)\n"
        << markers_.arg_sep << "\n"
        << "arg2_name\n"
        << markers_.value_sep << "\n"
        << "arg2_value (can be multiline)\n"
        << "...\n"
        << markers_.end_call << "\n";
    return out.str();
}

std::string ResponseParser::format_call(const std::string& name,
                                        const ToolArguments& arguments,
                                        const std::string& thought) const {
    std::ostringstream out;
    if (!thought.empty()) {
        out << thought << "\n";
    }
    out << markers_.begin_call << "\n" << name << "\n";
    for (const auto& [arg_name, value] : arguments) {
        out << markers_.arg_sep << "\n"
            << arg_name << "\n"
            << markers_.value_sep << "\n"
            << value << "\n";
    }
    out << markers_.end_call;
    return out.str();
}

}  // namespace tailcall::protocol
