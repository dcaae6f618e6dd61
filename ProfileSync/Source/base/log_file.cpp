// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "log_file.h"
#include <psync/file_access.h>
#include <psync/file_io.h>
#include <psync/file_traverser.h>
#include "sync_events.h"

using namespace psync;


namespace
{
const int SEPARATION_LINE_LEN = 40;
const Zchar LOG_FILE_EXTENSION[] = Zstr(".log");


std::string generateLogHeader(const SyncSummary& s, const ErrorLog& log)
{
    const std::string tabSpace(4, ' ');
    const TimeComp tc = getLocalTime(s.startTime); //returns TimeComp() on error

    std::string header = s.profileId + ' ' + formatTime(formatIsoDateTag, tc) + " [" + formatTime(formatIsoTimeTag, tc) + "]\n";

    const ErrorLogStats logCount = getStats(log);
    std::vector<std::string> summary;
    summary.push_back(tabSpace + utfTo<std::string>(_("Result:")) + ' ' + getSyncStatusLabel(s.result));
    if (logCount.error   > 0) summary.push_back(tabSpace + utfTo<std::string>(_("Errors:"))   + ' ' + numberTo<std::string>(logCount.error));
    if (logCount.warning > 0) summary.push_back(tabSpace + utfTo<std::string>(_("Warnings:")) + ' ' + numberTo<std::string>(logCount.warning));
    summary.push_back(tabSpace + utfTo<std::string>(_("Total time:")) + ' ' +
                      numberTo<std::string>(std::chrono::duration_cast<std::chrono::seconds>(s.totalTime).count()) + " s");

    const std::string sepLine(SEPARATION_LINE_LEN, '_');

    header += sepLine + '\n';
    for (const std::string& line : summary)
        header += line + '\n';
    header += sepLine + "\n\n";
    return header;
}


void limitLogfileCount(const Zstring& logFolderPath, int logfilesMaxAgeDays, const Zstring& logFilePathToKeep) //throw FileError
{
    if (logfilesMaxAgeDays <= 0)
        return;

    const time_t cutOffTime = std::time(nullptr) - static_cast<time_t>(logfilesMaxAgeDays) * 24 * 3600;

    std::vector<Zstring> oldLogFiles;
    traverseFolder(logFolderPath, [&](const FileInfo& fi)
    {
        if (endsWith(fi.itemName, LOG_FILE_EXTENSION) &&
            fi.modTime < cutOffTime &&
            fi.fullPath != logFilePathToKeep)
            oldLogFiles.push_back(fi.fullPath);
    }, nullptr, nullptr); //throw FileError

    std::exception_ptr firstError;

    for (const Zstring& filePath : oldLogFiles)
        try
        {
            removeFileIfExists(filePath); //throw FileError
        }
        catch (const FileError&) { if (!firstError) firstError = std::current_exception(); }

    if (firstError) //late failure!
        std::rethrow_exception(firstError);
}
}


Zstring psync::generateLogFileName(const SyncSummary& summary) //throw FileError
{
    const TimeComp tc = getLocalTime(summary.startTime);
    if (tc == TimeComp())
        throw FileError(L"Failed to determine current time: (time_t) " + numberTo<std::wstring>(summary.startTime));

    Zstring logFileName = utfTo<Zstring>(summary.profileId) + Zstr(' ') + formatTime(Zstr("%Y-%m-%d %H%M%S"), tc);

    if (summary.result != SyncStatus::synced)
        logFileName += Zstr(" [") + utfTo<Zstring>(getSyncStatusLabel(summary.result)) + Zstr(']');

    return logFileName + LOG_FILE_EXTENSION;
}


Zstring psync::saveLogFile(const Zstring& logFolderPath, //throw FileError
                           const SyncSummary& summary,
                           const ErrorLog& log,
                           int logfilesMaxAgeDays)
{
    createDirectoryIfMissingRecursion(logFolderPath); //throw FileError

    const Zstring logFilePath = appendPath(logFolderPath, generateLogFileName(summary)); //throw FileError

    std::string logContent = generateLogHeader(summary, log);
    for (const LogEntry& entry : log)
        logContent += formatMessage(entry);

    std::exception_ptr firstError;
    try
    {
        setFileContent(logFilePath, logContent, nullptr /*notifyUnbufferedIO*/); //throw FileError
    }
    catch (const FileError&) { firstError = std::current_exception(); }

    try
    {
        limitLogfileCount(logFolderPath, logfilesMaxAgeDays, logFilePath); //throw FileError
    }
    catch (const FileError&) { if (!firstError) firstError = std::current_exception(); }

    if (firstError) //late failure!
        std::rethrow_exception(firstError);

    return logFilePath;
}
