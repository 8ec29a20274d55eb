/**
 * @file JsonCodec.hpp
 * @brief JSON mapping for the persisted documents (pending store, release records, config).
 */

#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "domain/ChangeEntry.hpp"
#include "domain/PendingChangeSet.hpp"
#include "domain/ProjectConfig.hpp"
#include "domain/ReleaseRecord.hpp"

namespace chlog::infrastructure {

/// Keeps keys in insertion order so files read in changelog order.
using json = nlohmann::ordered_json;

/**
 * @class JsonCodec
 * @brief Manual JSON mapping for the domain types.
 *
 * Every FromJson throws domain::ConfigCorruptError when the document does
 * not have the expected shape.
 */
class JsonCodec {
public:
    static json EntryToJson(const domain::ChangeEntry& entry);
    static domain::ChangeEntry EntryFromJson(const json& j);

    static json ChangesToJson(const domain::PendingChangeSet::CategoryMap& changes);

    static json PendingToJson(const domain::PendingChangeSet& changes);
    static domain::PendingChangeSet PendingFromJson(const json& j);

    static json ReleaseToJson(const domain::ReleaseRecord& release);
    static domain::ReleaseRecord ReleaseFromJson(const json& j);

    static json ConfigToJson(const domain::ProjectConfig& config);

    /**
     * @brief Reads a config document; fields missing from @p j keep the value from @p defaults.
     */
    static domain::ProjectConfig ConfigFromJson(const json& j, const domain::ProjectConfig& defaults);

    /**
     * @brief Parses text, mapping parse errors to domain::ConfigCorruptError.
     */
    static json Parse(const std::string& text);
};

} // namespace chlog::infrastructure
