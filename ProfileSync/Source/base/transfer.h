// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef TRANSFER_H_7461029358173046
#define TRANSFER_H_7461029358173046

#include "manifest.h"
#include "process_callback.h"
#include "../afs/object_store.h"


namespace psync
{
const size_t DEFAULT_TRANSFER_THREADS = 8;

/*  Bounded parallel transfer of profile files:
    - signed URLs are requested in a single batch up front
    - a failing file is logged as a warning and skipped: the number of failed files is returned
    - cancellation: callback.requestUiUpdate() throws, workers are interrupted between I/O chunks   */

int uploadProfileFiles(ObjectStore& store,
                       const std::string& profileId,
                       const Zstring& dataFolderPath,
                       const std::vector<ManifestFileEntry>& files,
                       size_t transferThreads,
                       ProcessCallback& callback); //throw ErrorTransfer, X

//parent folders are created as needed; modification times are restored from the manifest
int downloadProfileFiles(ObjectStore& store,
                         const std::string& profileId,
                         const Zstring& dataFolderPath,
                         const std::vector<ManifestFileEntry>& files,
                         size_t transferThreads,
                         ProcessCallback& callback); //throw ErrorTransfer, X

//"already gone" is success
int deleteLocalFiles(const Zstring& dataFolderPath, const std::vector<std::string>& relPaths, PhaseCallback& callback); //throw X

int deleteRemoteFiles(ObjectStore& store, const std::string& profileId, const std::vector<std::string>& relPaths, PhaseCallback& callback); //throw X

//reject absolute paths and "." or ".." components from untrusted manifests
Zstring getLocalFilePath(const Zstring& dataFolderPath, const std::string& relPath); //throw ErrorInvalidData
}

#endif //TRANSFER_H_7461029358173046
