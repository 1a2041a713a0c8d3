#pragma once

#include <string>
#include "core/errors/agent_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace tailcall::protocol {

// The four literal delimiters of a call block. They are shown verbatim to
// the model, so they must stay stable for the lifetime of a run.
struct ProtocolMarkers {
    std::string begin_call = "----BEGIN_FUNCTION_CALL----";
    std::string end_call = "----END_FUNCTION_CALL----";
    std::string arg_sep = "----ARG----";
    std::string value_sep = "----VALUE----";
};

// Recovers exactly one function call from free-form model output.
//
// Markers are located from the end of the text backward, so that marker-like
// text from earlier, abandoned attempts in the reasoning is ignored: only the
// last complete BEGIN..END block is decoded. Argument blocks are consumed
// right to left and written with overwrite semantics, which means that when a
// name repeats, the block closest to BEGIN wins.
class ResponseParser {
public:
    ResponseParser() = default;

    // Fails with "invalid_protocol_markers" when the markers are empty,
    // duplicated, or one contains another.
    static core::errors::Result<ResponseParser> create(ProtocolMarkers markers);
    static core::errors::Result<ProtocolMarkers> validate_markers(
        const ProtocolMarkers& markers);

    // Error codes: missing_end_marker, missing_begin_marker,
    // malformed_argument_block, missing_function_name.
    core::errors::Result<ParsedCall> parse(const std::string& text) const;

    // The template embedded in the system block so the model knows the format.
    std::string response_template() const;

    // Encodes a call the way a well-behaved model would write it.
    std::string format_call(const std::string& name, const ToolArguments& arguments,
                            const std::string& thought = "") const;

    // Provider stop sequence; generation can halt right at the END marker.
    const std::string& stop_sequence() const { return markers_.end_call; }

    // Providers that honour the stop sequence drop it from their output.
    // Appends the END marker when the last BEGIN has no END after it;
    // otherwise returns the text unchanged.
    std::string restore_stop_sequence(const std::string& text) const;

    const ProtocolMarkers& markers() const { return markers_; }

private:
    explicit ResponseParser(ProtocolMarkers markers);

    ProtocolMarkers markers_;
};

}  // namespace tailcall::protocol
