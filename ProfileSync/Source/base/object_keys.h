// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef OBJECT_KEYS_H_3502917468203915
#define OBJECT_KEYS_H_3502917468203915

#include "local_store.h"


namespace psync
{
//remote key layout: must stay compatible with existing data
inline std::string getProfilesKeyPrefix() { return "profiles/"; }

inline std::string getProfileKeyPrefix  (const std::string& profileId) { return getProfilesKeyPrefix() + profileId + '/'; }
inline std::string getManifestKey       (const std::string& profileId) { return getProfileKeyPrefix(profileId) + "manifest.json"; }
inline std::string getProfileMetadataKey(const std::string& profileId) { return getProfileKeyPrefix(profileId) + "metadata.json"; }

inline std::string getProfileFileKey(const std::string& profileId, const std::string& relPath) { return getProfileKeyPrefix(profileId) + "files/" + relPath; }

inline std::string getEntityKeyPrefix(EntityKind kind) { return getEntityKindFolder(kind) + '/'; }
inline std::string getEntityKey(EntityKind kind, const std::string& entityId) { return getEntityKeyPrefix(kind) + entityId + ".json"; }

inline std::string getTombstoneKey(const std::string& kindFolder, const std::string& id) { return "tombstones/" + kindFolder + '/' + id + ".json"; }
inline std::string getProfileTombstoneKey(const std::string& profileId) { return getTombstoneKey("profiles", profileId); }
inline std::string getEntityTombstoneKey(EntityKind kind, const std::string& entityId) { return getTombstoneKey(getEntityKindFolder(kind), entityId); }
}

#endif //OBJECT_KEYS_H_3502917468203915
