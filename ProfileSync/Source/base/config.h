// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef CONFIG_H_2960175438016293
#define CONFIG_H_2960175438016293

#include <vector>
#include <psync/file_error.h>


namespace psync
{
struct SyncConfig
{
    std::string serverUrl; //e.g. "https://sync.example.com"
    std::string token;     //bearer token
    Zstring caCertFilePath; //optional; empty: do not verify peer

    size_t transferThreads = 8; //parallel file transfers per sync pass
    int timeoutSec = 20;

    Zstring profilesFolder;
    Zstring entitiesFolder;

    Zstring logFolder; //optional; empty: no log files
    int logfilesMaxAgeDays = 14; //<= 0: keep all

    std::vector<Zstring> extraExcludePatterns; //appended to the default exclusion list

    bool operator==(const SyncConfig&) const = default;
};

//missing values fall back to defaults; invalid values are reported as warning and replaced by defaults
std::pair<SyncConfig, std::wstring /*warningMsg*/> readConfig(const Zstring& filePath); //throw FileError, ErrorSerialization

void writeConfig(const SyncConfig& cfg, const Zstring& filePath); //throw FileError

//default exclusion list + extraExcludePatterns
std::vector<Zstring> getExcludePatterns(const SyncConfig& cfg);
}

#endif //CONFIG_H_2960175438016293
