// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "config.h"
#include <psync/file_access.h>
#include <psync/file_io.h>
#include <psync/json.h>
#include "exclude_filter.h"

using namespace psync;


namespace
{
//-------------------------------------------------------------------------------------------------------------------------------
const int JSON_FORMAT_CONFIG = 1; //2025-03-08
//-------------------------------------------------------------------------------------------------------------------------------

const char CONFIG_TYPE[] = "ProfileSync";


void readString(const JsonValue& jcfg, const char* name, std::string& value)
{
    if (const JsonValue* child = getChildFromJsonObject(jcfg, name))
        if (child->type == JsonValue::Type::string)
            value = child->primVal;
}


void readPath(const JsonValue& jcfg, const char* name, Zstring& value)
{
    std::string tmp;
    readString(jcfg, name, tmp);
    if (!tmp.empty())
        value = utfTo<Zstring>(tmp);
}


template <class Num>
void readPositiveNumber(const JsonValue& jcfg, const char* name, Num& value, std::wstring& warningMsg)
{
    if (getChildFromJsonObject(jcfg, name))
    {
        const std::optional<int64_t> num = getNumberFromJsonObject<int64_t>(jcfg, name);
        if (num && *num > 0)
            value = static_cast<Num>(*num);
        else
            warningMsg += replaceCpy(_("Invalid value for %x: default is used."), L"%x", utfTo<std::wstring>(std::string(name))) + L'\n';
    }
}
}


std::pair<SyncConfig, std::wstring /*warningMsg*/> psync::readConfig(const Zstring& filePath) //throw FileError, ErrorSerialization
{
    const std::string stream = getFileContent(filePath, nullptr /*notifyUnbufferedIO*/); //throw FileError

    JsonValue jcfg;
    try
    {
        jcfg = parseJson(stream); //throw JsonParsingError
    }
    catch (const JsonParsingError& e)
    {
        throw ErrorSerialization(replaceCpy(_("File %x does not contain a valid configuration."), L"%x", fmtPath(filePath)), formatJsonParsingError(e));
    }

    if (jcfg.type != JsonValue::Type::object ||
        getPrimitiveFromJsonObject(jcfg, "configType").value_or(CONFIG_TYPE) != CONFIG_TYPE)
        throw ErrorSerialization(replaceCpy(_("File %x does not contain a valid configuration."), L"%x", fmtPath(filePath)));

    std::wstring warningMsg;

    if (getNumberFromJsonObject<int>(jcfg, "formatVersion").value_or(JSON_FORMAT_CONFIG) > JSON_FORMAT_CONFIG)
        warningMsg += replaceCpy(_("Configuration file %x was created by a newer version."), L"%x", fmtPath(filePath)) + L'\n';

    SyncConfig cfg;
    readString(jcfg, "serverUrl", cfg.serverUrl);
    readString(jcfg, "token",     cfg.token);
    readPath  (jcfg, "caCertFilePath", cfg.caCertFilePath);

    readPositiveNumber(jcfg, "transferThreads", cfg.transferThreads, warningMsg);
    readPositiveNumber(jcfg, "timeoutSec",      cfg.timeoutSec,      warningMsg);

    readPath(jcfg, "profilesFolder", cfg.profilesFolder);
    readPath(jcfg, "entitiesFolder", cfg.entitiesFolder);
    readPath(jcfg, "logFolder",      cfg.logFolder);

    if (const std::optional<int> maxAge = getNumberFromJsonObject<int>(jcfg, "logfilesMaxAgeDays"))
        cfg.logfilesMaxAgeDays = *maxAge;

    if (const JsonValue* jexcludes = getChildFromJsonObject(jcfg, "extraExcludePatterns"))
        if (jexcludes->type == JsonValue::Type::array)
            for (const JsonValue& jpattern : jexcludes->arrayVal)
                if (jpattern.type == JsonValue::Type::string)
                    cfg.extraExcludePatterns.push_back(utfTo<Zstring>(jpattern.primVal));

    if (!warningMsg.empty())
        warningMsg = replaceCpy(_("Configuration file %x loaded partially only."), L"%x", fmtPath(filePath)) + L"\n\n" + trimCpy(warningMsg);

    return {cfg, warningMsg};
}


void psync::writeConfig(const SyncConfig& cfg, const Zstring& filePath) //throw FileError
{
    std::vector<JsonValue> jexcludes;
    for (const Zstring& pattern : cfg.extraExcludePatterns)
        jexcludes.emplace_back(utfTo<std::string>(pattern));

    JsonValue jcfg(JsonValue::Type::object);
    jcfg.objectVal.emplace("configType",    CONFIG_TYPE);
    jcfg.objectVal.emplace("formatVersion", JSON_FORMAT_CONFIG);

    jcfg.objectVal.emplace("serverUrl",      cfg.serverUrl);
    jcfg.objectVal.emplace("token",          cfg.token);
    jcfg.objectVal.emplace("caCertFilePath", utfTo<std::string>(cfg.caCertFilePath));

    jcfg.objectVal.emplace("transferThreads", static_cast<uint64_t>(cfg.transferThreads));
    jcfg.objectVal.emplace("timeoutSec",      cfg.timeoutSec);

    jcfg.objectVal.emplace("profilesFolder", utfTo<std::string>(cfg.profilesFolder));
    jcfg.objectVal.emplace("entitiesFolder", utfTo<std::string>(cfg.entitiesFolder));
    jcfg.objectVal.emplace("logFolder",      utfTo<std::string>(cfg.logFolder));
    jcfg.objectVal.emplace("logfilesMaxAgeDays", cfg.logfilesMaxAgeDays);

    jcfg.objectVal.emplace("extraExcludePatterns", std::move(jexcludes));

    if (const Zstring parentPath = getParentFolderPath(filePath);
        !parentPath.empty())
        createDirectoryIfMissingRecursion(parentPath); //throw FileError

    setFileContent(filePath, serializeJson(jcfg), nullptr /*notifyUnbufferedIO*/); //throw FileError
}


std::vector<Zstring> psync::getExcludePatterns(const SyncConfig& cfg)
{
    std::vector<Zstring> patterns = getDefaultExcludePatterns();
    patterns.insert(patterns.end(), cfg.extraExcludePatterns.begin(), cfg.extraExcludePatterns.end());
    return patterns;
}
