#pragma once

#include <resparse/core/http.hpp>
#include <resparse/model/shape.hpp>
#include <resparse/protocol/shape_decoder.hpp>

#include <string_view>

namespace resparse {

// ---------------------------------------------------------------------------
// IProtocol — one wire-format dialect's success and error extraction.
//
// ResponseParser picks the method by status code and normalizes the
// ResponseMetadata / Error envelope afterwards; implementations return the
// document as their dialect yields it.
//
// `shape` is the operation's output structure, or nullptr when the operation
// declares no output. Implementations are immutable after construction and
// safe for concurrent use.
// ---------------------------------------------------------------------------
class IProtocol {
public:
    virtual ~IProtocol() = default;

    // Non-copyable, non-movable (polymorphic base; REST variants hold
    // references into themselves).
    IProtocol(const IProtocol&) = delete;
    IProtocol& operator=(const IProtocol&) = delete;
    IProtocol(IProtocol&&) = delete;
    IProtocol& operator=(IProtocol&&) = delete;

    [[nodiscard]] virtual std::string_view Name() const noexcept = 0;

    [[nodiscard]] virtual DecodeResult DecodeSuccess(const HttpResponse& response,
                                                     const Shape* shape) const = 0;

    [[nodiscard]] virtual DecodeResult DecodeError(const HttpResponse& response,
                                                   const Shape* shape) const = 0;

protected:
    IProtocol() = default;
};

} // namespace resparse
