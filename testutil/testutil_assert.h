// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef TESTUTIL_ASSERT_H_4180396257104382
#define TESTUTIL_ASSERT_H_4180396257104382

#include <iostream>

//============================================================================
//                         Standard Test Macros
//============================================================================

inline int ASSERT_COUNT = 0;

inline void TESTUTIL_ASSERT_FUNCT(bool failed, const char* msg, const char* file, int line)
{
    if (failed)
    {
        std::cout << "Error " << file << "(" << line << "): " << msg << "    (failed)" << std::endl;
        ++ASSERT_COUNT;
    }
}
#define ASSERT(X) { TESTUTIL_ASSERT_FUNCT(!(X), #X, __FILE__, __LINE__); }

//expression must throw exception of type E
#define ASSERT_THROWS(X, E)                                                     \
    {                                                                           \
        bool testutilThrown = false;                                            \
        try { X; }                                                              \
        catch (const E&) { testutilThrown = true; }                             \
        TESTUTIL_ASSERT_FUNCT(!testutilThrown, #X " throws " #E, __FILE__, __LINE__); \
    }

#endif //TESTUTIL_ASSERT_H_4180396257104382
