#include "test_common.h"

#include "modpack/manifest.h"

using namespace modpack;

static ManifestInput pasted(const std::string& s) {
    ManifestInput in;
    in.pasted_text = s;
    return in;
}

static ManifestInput file(const std::string& s) {
    ManifestInput in;
    in.file_content = s;
    in.has_file = true;
    return in;
}

int main() {
    const size_t limit = 1000000;

    // pasted text is trimmed and wins over the file
    {
        ManifestInput in = file("{\"name\":\"from-file\"}");
        in.pasted_text = "  \n{\"name\":\"from-text\"}\n\t";
        auto r = check_manifest(in, limit);
        expect_true(r.kind == FailureKind::NONE, "pasted text accepted");
        expect_eq_str(r.content, "{\"name\":\"from-text\"}", "pasted text wins and is trimmed");
    }

    // whitespace-only text falls back to the file
    {
        ManifestInput in = file("{\"name\":\"from-file\"}");
        in.pasted_text = " \r\n ";
        auto r = check_manifest(in, limit);
        expect_true(r.kind == FailureKind::NONE, "file accepted");
        expect_eq_str(r.content, "{\"name\":\"from-file\"}", "blank text falls back to file");
    }

    // file content is used verbatim (not trimmed)
    {
        auto r = check_manifest(file("{\"a\":1}\n"), limit);
        expect_true(r.kind == FailureKind::NONE, "file with newline accepted");
        expect_eq_str(r.content, "{\"a\":1}\n", "file content verbatim");
    }

    // nothing provided
    {
        auto r = check_manifest(ManifestInput{}, limit);
        expect_true(r.kind == FailureKind::MISSING_INPUT, "empty input is missing");
        expect_eq_str(r.message, "No package.json provided.", "missing message");

        auto r2 = check_manifest(file(""), limit);
        expect_true(r2.kind == FailureKind::MISSING_INPUT, "empty file is missing");

        auto r3 = check_manifest(pasted("   "), limit);
        expect_true(r3.kind == FailureKind::MISSING_INPUT, "blank text without file is missing");
    }

    // size limit, checked before parsing
    {
        std::string big = "{\"x\":\"" + std::string(40, 'a') + "\"}";
        auto r = check_manifest(pasted(big), 32);
        expect_true(r.kind == FailureKind::TOO_LARGE, "oversized text");
        expect_eq_str(r.message, "JSON too large (32 byte limit).", "text too large message");

        auto r2 = check_manifest(file(big), 32);
        expect_true(r2.kind == FailureKind::TOO_LARGE, "oversized file");
        expect_eq_str(r2.message, "File too large (32 byte limit).", "file too large message");

        auto r3 = check_manifest(file(std::string(64, '!')), 32);
        expect_true(r3.kind == FailureKind::TOO_LARGE, "size wins over malformed");

        std::string exact = "{\"k\":\"" + std::string(32 - 8, 'b') + "\"}";
        expect_eq_ll((long long)exact.size(), 32, "exact fixture length");
        auto r4 = check_manifest(file(exact), 32);
        expect_true(r4.kind == FailureKind::NONE, "exactly at the limit is accepted");
    }

    // malformed
    {
        const char* bad[] = {
            "{\"name\": ",
            "not json",
            "{\"a\":1} trailing",
            "[1,2,3]",
            "\"just a string\"",
            "42",
            "null",
            "{'name':'x'}",
            "{\"a\":1,}",
            "{\"a\":[1,2,],\"b\":2}",
            "{\"a\":1 /*c*/}",
            "{\"a\":1 // c\n}",
            "{\"a\":NaN}",
            "{\"a\":Infinity}",
            "{\"a\":-Infinity}",
            "{\"a\":TRUE}",
        };
        for (const char* b : bad) {
            auto r = check_manifest(pasted(b), limit);
            expect_true(r.kind == FailureKind::MALFORMED_INPUT, std::string("malformed: ") + b);
            expect_eq_str(r.message, "Invalid JSON.", "malformed message");
            expect_true(r.content.empty(), "no content on failure");
        }
    }

    // unknown fields and odd-but-valid manifests pass through untouched
    {
        auto r = check_manifest(pasted("{\"dependencies\":{\"left-pad\":\"^1.3.0\"},\"x-custom\":[null,true]}"), limit);
        expect_true(r.kind == FailureKind::NONE, "valid manifest with extra fields");
        auto r2 = check_manifest(pasted("{}"), limit);
        expect_true(r2.kind == FailureKind::NONE, "empty object is a manifest");
    }

    // deep but valid nesting is still a manifest
    {
        std::string deep = "{\"d\":";
        for (int i = 0; i < 100; i++) deep += "[";
        for (int i = 0; i < 100; i++) deep += "]";
        deep += "}";
        auto r = check_manifest(pasted(deep), limit);
        expect_true(r.kind == FailureKind::NONE, "100 levels of nesting accepted");
    }

    expect_true(is_input_error(FailureKind::MALFORMED_INPUT), "malformed is an input error");
    expect_true(!is_input_error(FailureKind::BUILD_TOOL), "tool failure is not an input error");
    expect_eq_str(failure_kind_name(FailureKind::ARCHIVE_TOOL), "archive_tool", "kind name");
    expect_eq_str(trim_ws("\t a b \n"), "a b", "trim");

    std::cout << "test_manifest: ALL PASSED\n";
    return 0;
}
