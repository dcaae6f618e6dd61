// *****************************************************************************
// * This file is part of the ProfileSync project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include <psync/json.h>
#include <psync/open_ssl.h>
#include <psync/string_tools.h>
#include <psync/time.h>
#include <psync/error_log.h>
#include <psync/i18n.h>
#include <testutil/testutil_assert.h>
#include <testutil/testutil_psync.h>

using namespace psync;


namespace
{
void testRfc3339()
{
    ASSERT(formatRfc3339(0) == "1970-01-01T00:00:00Z");
    ASSERT(formatRfc3339(1704153600) == "2024-01-02T00:00:00Z");

    ASSERT(parseRfc3339("2024-01-02T00:00:00Z") == 1704153600);
    ASSERT(parseRfc3339("2024-01-02T00:00:00.123456Z") == 1704153600);
    ASSERT(parseRfc3339("2024-01-02T01:00:00+01:00") == 1704153600);
    ASSERT(parseRfc3339("2024-01-01T23:00:00-01:00") == 1704153600);

    ASSERT(!parseRfc3339(""));
    ASSERT(!parseRfc3339("not a date"));
    ASSERT(!parseRfc3339("2024-01-02"));
    ASSERT(!parseRfc3339("2024-01-02T00:00:00")); //time zone is mandatory
}


void testJson()
{
    const JsonValue jval = parseJson(R"({"name": "Café", "size": 42, "tags": ["a", "b"], "ok": true, "none": null})");
    ASSERT(jval.type == JsonValue::Type::object);
    ASSERT(getPrimitiveFromJsonObject(jval, "name") == "Caf\xc3\xa9");
    ASSERT(getNumberFromJsonObject<int>(jval, "size") == 42);
    ASSERT(getBoolFromJsonObject(jval, "ok") == true);
    ASSERT(!getPrimitiveFromJsonObject(jval, "none"));
    ASSERT(!getPrimitiveFromJsonObject(jval, "missing"));

    const JsonValue* tags = getChildFromJsonObject(jval, "tags");
    ASSERT(tags && tags->arrayVal.size() == 2 && tags->arrayVal[1].primVal == "b");

    //serialized output parses to the same structure
    const JsonValue jval2 = parseJson(serializeJson(jval));
    ASSERT(getPrimitiveFromJsonObject(jval2, "name") == "Caf\xc3\xa9");
    ASSERT(getNumberFromJsonObject<int>(jval2, "size") == 42);

    ASSERT_THROWS(parseJson("{\"a\": }"), JsonParsingError);
    ASSERT_THROWS(parseJson("[1, 2"), JsonParsingError);
    ASSERT_THROWS(parseJson("{} trailing"), JsonParsingError);
}


void testStringTools()
{
    ASSERT(afterLast (std::string("a/b/c"), '/', IfNotFoundReturn::none) == "c");
    ASSERT(beforeLast(std::string("a/b/c"), '/', IfNotFoundReturn::none) == "a/b");
    ASSERT(afterFirst(std::string("abc"), '/', IfNotFoundReturn::all) == "abc");
    ASSERT(splitCpy(std::string("a//b"), '/', SplitOnEmpty::skip).size() == 2);
    ASSERT(splitCpy(std::string("a//b"), '/', SplitOnEmpty::allow).size() == 3);
    ASSERT(trimCpy(std::string("  x \n")) == "x");
    ASSERT(replaceCpy(std::string("%x of %x"), "%x", "1") == "1 of 1");
    ASSERT(numberTo<std::string>(-17) == "-17");
    ASSERT(stringTo<int>(std::string("123")) == 123);
}


void testSha256()
{
    ASSERT(hashBytesSha256("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    ASSERT(hashBytesSha256("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    TestFolder tmp("sha256");
    writeTestFile(tmp.path(), Zstr("file.txt"), "abc");
    ASSERT(hashFileSha256(tmp / Zstr("file.txt"), nullptr) == hashBytesSha256("abc"));

    //larger than the read block size
    const std::string bigContent(300 * 1024 + 7, 'x');
    writeTestFile(tmp.path(), Zstr("big.bin"), bigContent);
    ASSERT(hashFileSha256(tmp / Zstr("big.bin"), nullptr) == hashBytesSha256(bigContent));
}


void testErrorLog()
{
    ErrorLog log;
    logMsg(log, L"first", MSG_TYPE_INFO);
    logMsg(log, L"second\nline", MSG_TYPE_WARNING);
    logMsg(log, L"third", MSG_TYPE_WARNING);

    const ErrorLogStats stats = getStats(log);
    ASSERT(stats.info == 1 && stats.warning == 2 && stats.error == 0);

    const std::string formatted = formatMessage(log[1]);
    ASSERT(contains(formatted, "second\n"));
    ASSERT(endsWith(formatted, "line\n"));
}


struct BracketTranslator : public TranslationHandler
{
    std::wstring translate(const std::wstring& text) const override { return L'[' + text + L']'; }
    std::wstring translate(const std::wstring& singular, const std::wstring& plural, int64_t n) const override
    {
        return L'[' + replaceCpy(n == 1 ? singular : plural, L"%x", numberTo<std::wstring>(n)) + L']';
    }
};


void testTranslation()
{
    ASSERT(_("Uploading manifest...") == L"Uploading manifest...");
    ASSERT(_P("1 file", "%x files", 1) == L"1 file");
    ASSERT(_P("1 file", "%x files", 3) == L"3 files");

    setTranslator(std::make_unique<BracketTranslator>());
    ASSERT(_("Uploading manifest...") == L"[Uploading manifest...]");
    ASSERT(_P("1 file", "%x files", 12) == L"[12 files]");

    setTranslator(nullptr);
    ASSERT(_("Uploading manifest...") == L"Uploading manifest...");
}
}


int main(int argc, char* argv[])
{
    openSslInit();

    testRfc3339();
    testJson();
    testStringTools();
    testSha256();
    testErrorLog();
    testTranslation();

    return ASSERT_COUNT;
}
