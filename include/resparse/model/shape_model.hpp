#pragma once

#include <resparse/core/result.hpp>
#include <resparse/model/shape.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace resparse {

// ---------------------------------------------------------------------------
// ShapeModel — shapes resolved from a JSON service description.
//
// Document layout:
//   {
//     "metadata":   {"protocol": "rest-xml", ...},
//     "operations": {"GetThing": {"output": {"shape": "GetThingOutput",
//                                            "resultWrapper": "GetThingResult"}}},
//     "shapes":     {"GetThingOutput": {"type": "structure", "members": {...}}}
//   }
//
// Member references ({"shape": "X", "locationName": ..., "location": ...,
// "flattened": ...}) resolve to their own Shape node so that member-level
// serialization never leaks into other references of the same target.
// Structure members keep their document order, hence ordered_json.
// Every shape is resolved eagerly at load time; the model is immutable after.
// ---------------------------------------------------------------------------
class ShapeModel {
public:
    [[nodiscard]] static Result<ShapeModel, Error> FromJson(
        const nlohmann::ordered_json& document);
    [[nodiscard]] static Result<ShapeModel, Error> FromFile(std::string_view path);

    /// metadata.protocol, or empty when the document does not name one.
    [[nodiscard]] const std::string& Protocol() const noexcept { return protocol_; }

    [[nodiscard]] Result<const Shape*, Error> Resolve(std::string_view shape_name) const;

    /// Output shape of an operation with its resultWrapper applied, or nullptr
    /// for an operation that declares no output.
    [[nodiscard]] Result<const Shape*, Error> OutputShape(std::string_view operation) const;

    [[nodiscard]] std::vector<std::string> OperationNames() const;

private:
    ShapeModel() = default;

    std::string protocol_;
    ShapeArena arena_;
    std::map<std::string, const Shape*, std::less<>> named_;
    std::map<std::string, const Shape*, std::less<>> outputs_;
};

} // namespace resparse
