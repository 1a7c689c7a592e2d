#include <resparse/model/shape_model.hpp>

#include <resparse/core/log.hpp>

#include <fstream>
#include <utility>

namespace resparse {

namespace {

Error ModelError(const std::string& message) {
    return Error{"ShapeModel", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::ShapeModel};
}

// Serialization keys that may appear on a member reference (or an operation
// output reference) and override the target shape's own values.
constexpr const char* kOverrideKeys[] = {
    "locationName", "location", "flattened", "resultWrapper"};

std::string OverrideSignature(const nlohmann::ordered_json* ref) {
    if (ref == nullptr) {
        return {};
    }
    nlohmann::ordered_json sig = nlohmann::ordered_json::object();
    for (const char* key : kOverrideKeys) {
        if (ref->contains(key)) {
            sig[key] = (*ref)[key];
        }
    }
    return sig.empty() ? std::string() : sig.dump();
}

Result<void, Error> ApplySerialization(const nlohmann::ordered_json& source,
                                       const std::string& context,
                                       Serialization& out) {
    if (auto it = source.find("locationName"); it != source.end()) {
        if (!it->is_string()) {
            return Result<void, Error>::Err(
                ModelError(context + ": locationName must be a string"));
        }
        out.name = it->get<std::string>();
    }
    if (auto it = source.find("location"); it != source.end()) {
        auto location = it->is_string()
            ? LocationFromString(it->get<std::string>())
            : std::nullopt;
        if (!location.has_value()) {
            // Request-only locations (uri, querystring) never occur in a
            // response; they are ignored rather than rejected.
            if (it->is_string() &&
                (*it == "uri" || *it == "querystring")) {
                LogDebug("ShapeModel", context + ": ignoring request location " +
                                           it->get<std::string>());
            } else {
                return Result<void, Error>::Err(
                    ModelError(context + ": unsupported location " + it->dump()));
            }
        } else {
            out.location = location;
        }
    }
    if (auto it = source.find("flattened"); it != source.end()) {
        if (!it->is_boolean()) {
            return Result<void, Error>::Err(
                ModelError(context + ": flattened must be a boolean"));
        }
        out.flattened = it->get<bool>();
    }
    if (auto it = source.find("payload"); it != source.end() && it->is_string()) {
        out.payload = it->get<std::string>();
    }
    if (auto it = source.find("resultWrapper"); it != source.end() && it->is_string()) {
        out.result_wrapper = it->get<std::string>();
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// ShapeResolver — memoized resolution of (shape name, reference overrides)
// into arena nodes. A node is memoized before its children are resolved so
// recursive shapes terminate as pointer cycles.
// ---------------------------------------------------------------------------
class ShapeResolver {
public:
    ShapeResolver(const nlohmann::ordered_json& shapes, ShapeArena& arena)
        : shapes_(shapes), arena_(arena) {}

    Result<const Shape*, Error> Resolve(const std::string& name,
                                        const nlohmann::ordered_json* ref) {
        const std::string memo_key = name + '\x1f' + OverrideSignature(ref);
        if (auto it = memo_.find(memo_key); it != memo_.end()) {
            return Result<const Shape*, Error>::Ok(it->second);
        }

        auto def_it = shapes_.find(name);
        if (def_it == shapes_.end() || !def_it->is_object()) {
            return Result<const Shape*, Error>::Err(
                ModelError("unknown shape '" + name + "'"));
        }
        const nlohmann::ordered_json& def = *def_it;

        const auto type_it = def.find("type");
        const auto kind = (type_it != def.end() && type_it->is_string())
            ? ShapeKindFromString(type_it->get<std::string>())
            : std::nullopt;
        if (!kind.has_value()) {
            return Result<const Shape*, Error>::Err(ModelError(
                "shape '" + name + "' has unsupported type " +
                (type_it != def.end() ? type_it->dump() : std::string("<missing>"))));
        }

        Shape shape;
        shape.kind = *kind;
        shape.name = name;
        auto own = ApplySerialization(def, "shape '" + name + "'", shape.serialization);
        if (own.IsErr()) {
            return Result<const Shape*, Error>::Err(std::move(own).Error());
        }
        if (ref != nullptr) {
            auto over = ApplySerialization(*ref, "reference to '" + name + "'",
                                           shape.serialization);
            if (over.IsErr()) {
                return Result<const Shape*, Error>::Err(std::move(over).Error());
            }
        }

        Shape& node = arena_.Add(std::move(shape));
        memo_[memo_key] = &node;

        auto linked = LinkChildren(node, def);
        if (linked.IsErr()) {
            return Result<const Shape*, Error>::Err(std::move(linked).Error());
        }
        return Result<const Shape*, Error>::Ok(&node);
    }

private:
    Result<const Shape*, Error> ResolveRef(const nlohmann::ordered_json& ref,
                                           const std::string& context) {
        if (!ref.is_object() || !ref.contains("shape") || !ref["shape"].is_string()) {
            return Result<const Shape*, Error>::Err(
                ModelError(context + ": reference must name a shape"));
        }
        return Resolve(ref["shape"].get<std::string>(), &ref);
    }

    Result<void, Error> LinkChildren(Shape& node, const nlohmann::ordered_json& def) {
        const std::string context = "shape '" + node.name + "'";
        switch (node.kind) {
            case ShapeKind::Structure: {
                const auto members = def.find("members");
                if (members == def.end()) {
                    return Result<void, Error>::Ok();
                }
                if (!members->is_object()) {
                    return Result<void, Error>::Err(
                        ModelError(context + ": members must be an object"));
                }
                for (const auto& [member_name, ref] : members->items()) {
                    auto child = ResolveRef(ref, context + " member '" + member_name + "'");
                    if (child.IsErr()) {
                        return Result<void, Error>::Err(std::move(child).Error());
                    }
                    node.members.push_back({member_name, child.Value()});
                }
                if (node.serialization.payload.has_value() &&
                    node.FindMember(*node.serialization.payload) == nullptr) {
                    return Result<void, Error>::Err(ModelError(
                        context + ": payload names unknown member '" +
                        *node.serialization.payload + "'"));
                }
                return Result<void, Error>::Ok();
            }
            case ShapeKind::List: {
                if (!def.contains("member")) {
                    return Result<void, Error>::Err(
                        ModelError(context + ": list without member"));
                }
                auto member = ResolveRef(def["member"], context + " member");
                if (member.IsErr()) {
                    return Result<void, Error>::Err(std::move(member).Error());
                }
                node.member = member.Value();
                return Result<void, Error>::Ok();
            }
            case ShapeKind::Map: {
                if (!def.contains("key") || !def.contains("value")) {
                    return Result<void, Error>::Err(
                        ModelError(context + ": map needs key and value"));
                }
                auto key = ResolveRef(def["key"], context + " key");
                if (key.IsErr()) {
                    return Result<void, Error>::Err(std::move(key).Error());
                }
                auto value = ResolveRef(def["value"], context + " value");
                if (value.IsErr()) {
                    return Result<void, Error>::Err(std::move(value).Error());
                }
                node.key = key.Value();
                node.value = value.Value();
                return Result<void, Error>::Ok();
            }
            default:
                return Result<void, Error>::Ok();
        }
    }

    const nlohmann::ordered_json& shapes_;
    ShapeArena& arena_;
    std::map<std::string, Shape*> memo_;
};

} // anonymous namespace

// ---------------------------------------------------------------------------
// Loading
// ---------------------------------------------------------------------------

Result<ShapeModel, Error> ShapeModel::FromJson(const nlohmann::ordered_json& document) {
    if (!document.is_object()) {
        return Result<ShapeModel, Error>::Err(
            ModelError("service model must be a JSON object"));
    }
    const auto shapes_it = document.find("shapes");
    if (shapes_it == document.end() || !shapes_it->is_object()) {
        return Result<ShapeModel, Error>::Err(
            ModelError("service model has no 'shapes' object"));
    }

    ShapeModel model;
    if (auto meta = document.find("metadata"); meta != document.end() && meta->is_object()) {
        if (auto protocol = meta->find("protocol");
            protocol != meta->end() && protocol->is_string()) {
            model.protocol_ = protocol->get<std::string>();
        }
    }

    ShapeResolver resolver(*shapes_it, model.arena_);

    for (auto it = shapes_it->begin(); it != shapes_it->end(); ++it) {
        auto resolved = resolver.Resolve(it.key(), nullptr);
        if (resolved.IsErr()) {
            return Result<ShapeModel, Error>::Err(std::move(resolved).Error());
        }
        model.named_.emplace(it.key(), resolved.Value());
    }

    if (auto ops = document.find("operations"); ops != document.end() && ops->is_object()) {
        for (const auto& [op_name, op] : ops->items()) {
            const Shape* output = nullptr;
            if (op.is_object() && op.contains("output")) {
                const auto& ref = op["output"];
                if (!ref.is_object() || !ref.contains("shape") || !ref["shape"].is_string()) {
                    return Result<ShapeModel, Error>::Err(ModelError(
                        "operation '" + op_name + "': output must name a shape"));
                }
                auto resolved = resolver.Resolve(ref["shape"].get<std::string>(), &ref);
                if (resolved.IsErr()) {
                    return Result<ShapeModel, Error>::Err(std::move(resolved).Error());
                }
                output = resolved.Value();
            }
            model.outputs_.emplace(op_name, output);
        }
    }

    LogDebug("ShapeModel", "resolved " + std::to_string(model.named_.size()) +
                               " shapes into " + std::to_string(model.arena_.Size()) +
                               " nodes");
    return Result<ShapeModel, Error>::Ok(std::move(model));
}

Result<ShapeModel, Error> ShapeModel::FromFile(std::string_view path) {
    std::ifstream in{std::string(path)};
    if (!in.good()) {
        return Result<ShapeModel, Error>::Err(Error{
            "ShapeModel", "", std::nullopt,
            "cannot open service model '" + std::string(path) + "'",
            std::nullopt, ErrorCategory::Io});
    }

    nlohmann::ordered_json document;
    try {
        document = nlohmann::ordered_json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        return Result<ShapeModel, Error>::Err(
            ModelError("invalid JSON in '" + std::string(path) + "': " + e.what()));
    }
    return FromJson(document);
}

// ---------------------------------------------------------------------------
// Lookup
// ---------------------------------------------------------------------------

Result<const Shape*, Error> ShapeModel::Resolve(std::string_view shape_name) const {
    auto it = named_.find(shape_name);
    if (it == named_.end()) {
        return Result<const Shape*, Error>::Err(
            ModelError("unknown shape '" + std::string(shape_name) + "'"));
    }
    return Result<const Shape*, Error>::Ok(it->second);
}

Result<const Shape*, Error> ShapeModel::OutputShape(std::string_view operation) const {
    auto it = outputs_.find(operation);
    if (it == outputs_.end()) {
        auto error = ModelError("unknown operation '" + std::string(operation) + "'");
        std::string known;
        for (const auto& name : OperationNames()) {
            known += known.empty() ? name : ", " + name;
        }
        error.detail = "known operations: " + (known.empty() ? std::string("none") : known);
        return Result<const Shape*, Error>::Err(std::move(error));
    }
    return Result<const Shape*, Error>::Ok(it->second);
}

std::vector<std::string> ShapeModel::OperationNames() const {
    std::vector<std::string> names;
    names.reserve(outputs_.size());
    for (const auto& [name, shape] : outputs_) {
        names.push_back(name);
    }
    return names;
}

} // namespace resparse
