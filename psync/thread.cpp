// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "thread.h"
#include <sys/prctl.h>

using namespace psync;


void psync::setCurrentThreadName(const Zstring& threadName)
{
    //Linux limits thread names to 15 chars + null terminator
    const Zstring nameTrunc = threadName.substr(0, 15);
    ::prctl(PR_SET_NAME, nameTrunc.c_str(), 0, 0, 0);
}
