// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef SCOPE_GUARD_H_3094185730951735
#define SCOPE_GUARD_H_3094185730951735

#include <cassert>
#include <exception>
#include <type_traits>
#include <utility>


namespace psync
{
/*  Scope Guard
        auto guardTmp = psync::makeGuard<ScopeGuardRunMode::onFail>([&] { removeFilePlain(tmpPath); });
            ...
        guardTmp.dismiss();

    Scope Exit:
        PSYNC_ON_SCOPE_EXIT   (::close(fd));
        PSYNC_ON_SCOPE_FAIL   (undoTemporaryWork());
        PSYNC_ON_SCOPE_SUCCESS(notifySuccess());                    */

enum class ScopeGuardRunMode
{
    onExit,
    onSuccess,
    onFail
};


template <ScopeGuardRunMode runMode, typename F>
class ScopeGuard
{
public:
    explicit ScopeGuard(const F&  fun) : fun_(fun) {}
    explicit ScopeGuard(      F&& fun) : fun_(std::move(fun)) {}

    ScopeGuard(ScopeGuard&& tmp) :
        fun_(std::move(tmp.fun_)),
        exceptionCount_(tmp.exceptionCount_),
        dismissed_(tmp.dismissed_) { tmp.dismissed_ = true; }

    ~ScopeGuard() noexcept(runMode == ScopeGuardRunMode::onFail)
    {
        if (dismissed_)
            return;

        const bool failed = std::uncaught_exceptions() > exceptionCount_;

        if constexpr (runMode == ScopeGuardRunMode::onSuccess)
        {
            if (!failed)
                fun_(); //throw X
        }
        else if (!failed && runMode == ScopeGuardRunMode::onExit)
            fun_(); //throw X
        else if (failed)
            try { fun_(); } //never throw while another exception is in flight
            catch (...) { assert(false); }
    }

    void dismiss() { dismissed_ = true; }

private:
    ScopeGuard           (const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;

    const F fun_;
    const int exceptionCount_ = std::uncaught_exceptions();
    bool dismissed_ = false;
};


template <ScopeGuardRunMode runMode, class F> inline
auto makeGuard(F&& fun) { return ScopeGuard<runMode, std::decay_t<F>>(std::forward<F>(fun)); }
}

#define PSYNC_CONCAT_SUB(X, Y) X ## Y
#define PSYNC_CONCAT(X, Y) PSYNC_CONCAT_SUB(X, Y)

#define PSYNC_CHECK_CASE_FOR_CONSTANT(X) case X: return PSYNC_CHECK_CASE_FOR_CONSTANT_IMPL(#X)
#define PSYNC_CHECK_CASE_FOR_CONSTANT_IMPL(X) L ## X

#define PSYNC_ON_SCOPE_EXIT(X)    [[maybe_unused]] auto PSYNC_CONCAT(scopeGuard, __LINE__) = psync::makeGuard<psync::ScopeGuardRunMode::onExit   >([&]{ X; });
#define PSYNC_ON_SCOPE_FAIL(X)    [[maybe_unused]] auto PSYNC_CONCAT(scopeGuard, __LINE__) = psync::makeGuard<psync::ScopeGuardRunMode::onFail   >([&]{ X; });
#define PSYNC_ON_SCOPE_SUCCESS(X) [[maybe_unused]] auto PSYNC_CONCAT(scopeGuard, __LINE__) = psync::makeGuard<psync::ScopeGuardRunMode::onSuccess>([&]{ X; });

#endif //SCOPE_GUARD_H_3094185730951735
