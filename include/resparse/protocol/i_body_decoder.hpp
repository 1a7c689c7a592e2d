#pragma once

#include <resparse/protocol/shape_decoder.hpp>

#include <string_view>

namespace resparse {

// ---------------------------------------------------------------------------
// IBodyDecoder — body-format strategy (XML or JSON) used by the REST
// protocols for the structured part of a response body.
// ---------------------------------------------------------------------------
class IBodyDecoder {
public:
    virtual ~IBodyDecoder() = default;

    /// Tokenize `body` and decode the document root against `shape`.
    /// A blank body decodes as an empty document.
    [[nodiscard]] virtual DecodeResult DecodeBody(const Shape& shape,
                                                  std::string_view body) const = 0;

    [[nodiscard]] virtual std::string_view Format() const noexcept = 0;

protected:
    IBodyDecoder() = default;
    IBodyDecoder(const IBodyDecoder&) = default;
    IBodyDecoder& operator=(const IBodyDecoder&) = default;
};

} // namespace resparse
