// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef LOG_FILE_H_5038216947120583
#define LOG_FILE_H_5038216947120583

#include <psync/error_log.h>
#include <psync/file_error.h>
#include "process_callback.h"


namespace psync
{
struct SyncSummary
{
    std::string profileId;
    SyncStatus result = SyncStatus::synced;
    time_t startTime = 0;
    std::chrono::milliseconds totalTime{};
};

//"<profile id> 2025-03-08 142501.log" (+ result if not "synced")
Zstring generateLogFileName(const SyncSummary& summary); //throw FileError

//returns path of the new log file; log files older than logfilesMaxAgeDays are removed
Zstring saveLogFile(const Zstring& logFolderPath, //throw FileError
                    const SyncSummary& summary,
                    const ErrorLog& log,
                    int logfilesMaxAgeDays /*<= 0: no limit*/);
}

#endif //LOG_FILE_H_5038216947120583
