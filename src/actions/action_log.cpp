#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <limits>
#include <eavdb/actions/action_log.h>
#include <eavdb/core/result_helpers.h>

namespace eavdb::actions {

using json = nlohmann::json;

namespace {

constexpr std::array<std::string_view, 4> kUpdateParams = {"ent_key", "attr_patches",
                                                           "attr_deletions", "ent_modified"};
constexpr std::array<std::string_view, 3> kUpsertParams = {"ent_key", "attr_patches",
                                                           "attr_deletions"};

struct ActionParams {
    EntKey entKey;
    codec::AttrMap patches;
    std::vector<std::string> deletions;
    std::optional<Millis> entModified;
};

// Error text only; invalid UTF-8 is replaced rather than thrown
std::string describe(const Action& action) {
    return action.dump(-1, ' ', false, json::error_handler_t::replace);
}

template<size_t N>
bool contains(const std::array<std::string_view, N>& names, std::string_view name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

bool acceptsParam(std::string_view type, std::string_view name) {
    return type == "update_ent" ? contains(kUpdateParams, name) : contains(kUpsertParams, name);
}

Result<ActionParams> readParams(std::string_view type, const json& params) {
    if (!params.is_object()) {
        return Error{ErrorCode::InvalidArgument, "action params must be an object"};
    }
    for (auto it = params.begin(); it != params.end(); ++it) {
        if (!acceptsParam(type, it.key())) {
            return Error{ErrorCode::InvalidArgument,
                         std::string(type) + " does not take param '" + it.key() + "'"};
        }
    }

    ActionParams out;
    auto key = params.find("ent_key");
    if (key == params.end() || !key->is_string()) {
        return Error{ErrorCode::InvalidArgument, "action params require a string ent_key"};
    }
    out.entKey = key->get<std::string>();

    if (auto patches = params.find("attr_patches");
        patches != params.end() && !patches->is_null()) {
        if (!patches->is_object()) {
            return Error{ErrorCode::InvalidArgument, "attr_patches must be an object"};
        }
        for (auto it = patches->begin(); it != patches->end(); ++it) {
            out.patches.emplace(it.key(), it.value());
        }
    }

    if (auto deletions = params.find("attr_deletions");
        deletions != params.end() && !deletions->is_null()) {
        if (!deletions->is_array()) {
            return Error{ErrorCode::InvalidArgument, "attr_deletions must be an array"};
        }
        for (const auto& name : *deletions) {
            if (!name.is_string()) {
                return Error{ErrorCode::InvalidArgument, "attr_deletions must hold strings"};
            }
            out.deletions.push_back(name.get<std::string>());
        }
    }

    if (auto modified = params.find("ent_modified");
        modified != params.end() && !modified->is_null()) {
        if (modified->is_number_unsigned() &&
            modified->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<Millis>::max())) {
            return Error{ErrorCode::InvalidArgument, "ent_modified out of range"};
        }
        if (!modified->is_number_integer()) {
            return Error{ErrorCode::InvalidArgument, "ent_modified must be an integer"};
        }
        out.entModified = modified->get<Millis>();
    }
    return out;
}

} // namespace

Result<void> validateAction(const Action& action) {
    if (!action.is_object()) {
        return Error{ErrorCode::InvalidAction, "action must be an object: " + describe(action)};
    }
    auto type = action.find("type");
    if (type == action.end() || !type->is_string() ||
        std::find(kActionTypes.begin(), kActionTypes.end(), type->get<std::string>()) ==
            kActionTypes.end()) {
        return Error{ErrorCode::InvalidAction, "invalid action: " + describe(action)};
    }
    return {};
}

Result<void> ActionWriter::writeActions(const std::vector<Action>& actions) {
    for (const auto& action : actions) {
        EAVDB_TRY(validateAction(action));
        std::string line;
        try {
            line = action.dump();
        } catch (const json::exception& e) {
            return Error{ErrorCode::SerializationError,
                         "cannot encode action: " + std::string(e.what())};
        }
        out_ << line << "\n";
        if (!out_) {
            return Error{ErrorCode::DatabaseError, "failed to write action"};
        }
    }
    out_.flush();
    return {};
}

Result<void> writeActionFile(const std::vector<Action>& actions,
                             const std::filesystem::path& dest) {
    std::ofstream out(dest, std::ios::trunc);
    if (!out) {
        return Error{ErrorCode::FileNotFound, "cannot open action file for writing: " +
                                                  dest.string()};
    }
    return ActionWriter(out).writeActions(actions);
}

Result<std::vector<std::vector<ActionResult>>>
ActionProcessor::processActionFiles(const std::vector<std::filesystem::path>& actionFiles) {
    std::vector<std::vector<ActionResult>> results;
    results.reserve(actionFiles.size());
    for (const auto& file : actionFiles) {
        EAVDB_TRY_UNWRAP(fileResults, processActionFile(file));
        results.push_back(std::move(fileResults));
    }
    return results;
}

Result<std::vector<ActionResult>>
ActionProcessor::processActionFile(const std::filesystem::path& actionFile) {
    EAVDB_TRY_UNWRAP(actions, parseActionFile(actionFile));
    spdlog::debug("Replaying {} actions from {}", actions.size(), actionFile.string());
    return processActions(actions);
}

Result<std::vector<Action>>
ActionProcessor::parseActionFile(const std::filesystem::path& actionFile) const {
    std::ifstream in(actionFile);
    if (!in) {
        return Error{ErrorCode::FileNotFound, "action file not found: " + actionFile.string()};
    }

    std::vector<Action> actions;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        try {
            actions.push_back(json::parse(line));
        } catch (const json::exception& e) {
            spdlog::error("Action file {}:{}: JSON parse error: {}", actionFile.string(), lineNo,
                          e.what());
            return Error{ErrorCode::InvalidData, actionFile.string() + ":" +
                                                     std::to_string(lineNo) + ": " + e.what()};
        }
    }
    return actions;
}

Result<std::vector<ActionResult>> ActionProcessor::processActions(const std::vector<Action>& actions) {
    std::vector<ActionResult> results;
    results.reserve(actions.size());
    for (const auto& action : actions) {
        EAVDB_TRY_UNWRAP(result, executeAction(action));
        results.push_back(std::move(result));
    }
    return results;
}

Result<ActionResult> ActionProcessor::executeAction(const Action& action) {
    EAVDB_TRY(validateAction(action));
    const auto type = action.at("type").get<std::string>();
    EAVDB_TRY_UNWRAP(params, readParams(type, action.value("params", json::object())));

    if (type == "update_ent") {
        EAVDB_TRY(store_.updateEnt(params.entKey, params.patches, params.deletions,
                                   params.entModified));
        return ActionResult{};
    }
    return store_.upsertEnt(params.entKey, params.patches, params.deletions);
}

} // namespace eavdb::actions
