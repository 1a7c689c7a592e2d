#pragma once

#include <resparse/core/timestamp.hpp>
#include <resparse/protocol/i_body_decoder.hpp>
#include <resparse/protocol/shape_decoder.hpp>

#include <nlohmann/json.hpp>

#include <string_view>

namespace resparse {

// ---------------------------------------------------------------------------
// JsonBodyDecoder — shape-driven walk over an already tokenized JSON tree.
//
// Only structures, maps, lists, blobs and timestamps are transformed; every
// other scalar keeps the primitive the tokenizer produced.
// ---------------------------------------------------------------------------
class JsonBodyDecoder : public ShapeDecoder<nlohmann::json>, public IBodyDecoder {
public:
    explicit JsonBodyDecoder(TimestampParser timestamp_parser = ParseTimestamp);

    [[nodiscard]] DecodeResult DecodeBody(const Shape& shape,
                                          std::string_view body) const override;

    [[nodiscard]] std::string_view Format() const noexcept override { return "json"; }

    /// Tokenize a body. Blank bodies yield an empty object; syntax errors are
    /// MalformedBody errors.
    [[nodiscard]] static Result<nlohmann::json, Error> ParseBody(std::string_view body,
                                                                 std::string_view operation);

protected:
    Result<void, Error> ForEachListItem(const Shape& shape, const nlohmann::json& node,
                                        const ItemVisitor& visit) const override;

    DecodeResult DecodeDefault(const Shape& shape, const nlohmann::json& node) const override;
    DecodeResult DecodeStructure(const Shape& shape, const nlohmann::json& node) const override;
    DecodeResult DecodeMap(const Shape& shape, const nlohmann::json& node) const override;
    DecodeResult DecodeBlob(const Shape& shape, const nlohmann::json& node) const override;
    DecodeResult DecodeTimestamp(const Shape& shape, const nlohmann::json& node) const override;

private:
    TimestampParser timestamp_parser_;
};

} // namespace resparse
