// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef I18N_H_7810465390217658
#define I18N_H_7810465390217658

#include <memory>
#include <mutex>
#include "string_tools.h"


//minimal layer enabling text translation without library dependencies
#define PSYNC_TRANS_CONCAT_SUB(X, Y) X ## Y
#define _(s)        psync::translate(PSYNC_TRANS_CONCAT_SUB(L, s))
#define _P(s, p, n) psync::translate(PSYNC_TRANS_CONCAT_SUB(L, s), PSYNC_TRANS_CONCAT_SUB(L, p), n)
//source and translation use %x as number placeholder


namespace psync
{
//implement handler to enable program-wide localizations
struct TranslationHandler
{
    TranslationHandler() {}
    virtual ~TranslationHandler() {}

    //THREAD-SAFETY: "const" member functions must be callable from worker threads
    virtual std::wstring translate(const std::wstring& text) const = 0;
    virtual std::wstring translate(const std::wstring& singular, const std::wstring& plural, int64_t n) const = 0;

private:
    TranslationHandler           (const TranslationHandler&) = delete;
    TranslationHandler& operator=(const TranslationHandler&) = delete;
};

void setTranslator(std::unique_ptr<const TranslationHandler>&& newHandler); //take ownership
std::shared_ptr<const TranslationHandler> getTranslator();








//######################## implementation ##############################
namespace impl
{
struct GlobalTranslator
{
    std::mutex lock;
    std::shared_ptr<const TranslationHandler> handler;
};

inline GlobalTranslator& getGlobalTranslator()
{
    static GlobalTranslator inst; //never destroyed before last use: function-local static
    return inst;
}
}


inline
std::shared_ptr<const TranslationHandler> getTranslator()
{
    impl::GlobalTranslator& gt = impl::getGlobalTranslator();
    std::lock_guard dummy(gt.lock);
    return gt.handler;
}


inline
void setTranslator(std::unique_ptr<const TranslationHandler>&& newHandler)
{
    impl::GlobalTranslator& gt = impl::getGlobalTranslator();
    std::lock_guard dummy(gt.lock);
    gt.handler = std::move(newHandler);
}


inline
std::wstring translate(const std::wstring& text)
{
    if (std::shared_ptr<const TranslationHandler> t = getTranslator())
        return t->translate(text);
    return text;
}


//"%x file" "%x files"
template <class T> inline
std::wstring translate(const std::wstring& singular, const std::wstring& plural, T n)
{
    const auto n64 = static_cast<int64_t>(n);

    if (std::shared_ptr<const TranslationHandler> t = getTranslator())
        return t->translate(singular, plural, n64);

    return replaceCpy(n64 == 1 || n64 == -1 ? singular : plural, L"%x", numberTo<std::wstring>(n64));
}
}

#endif //I18N_H_7810465390217658
