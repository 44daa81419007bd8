#include <filesystem>
#include "common/io_utils.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "language/language.hpp"

using namespace std;
using namespace codegrade;
using ::testing::ElementsAre;

TEST(LanguageTest, BuiltInLanguages) {
    language_registry registry = language_registry::defaults();
    EXPECT_THAT(registry.names(), ElementsAre("c", "cpp", "python3"));

    const language *c = registry.find("c");
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(c->source_file, "main.c");
    EXPECT_EQ(c->compile_command.front(), "gcc");
    EXPECT_THAT(c->artifact_files, ElementsAre("main"));
    EXPECT_THAT(c->run_command, ElementsAre("./main"));

    const language *python = registry.find("python3");
    ASSERT_NE(python, nullptr);
    EXPECT_THAT(python->artifact_files, ElementsAre("main.py"));

    EXPECT_EQ(registry.find("java"), nullptr);
    EXPECT_EQ(registry.find("C"), nullptr);
}

TEST(LanguageTest, UnsafeFileNamesAreRejected) {
    language_registry registry;
    EXPECT_THROW(registry.add({"evil", "../main.c", {"gcc"}, {"main"}, {"./main"}}), invalid_argument);
    EXPECT_THROW(registry.add({"evil", "main.c", {"gcc"}, {"/etc/passwd"}, {"./main"}}), invalid_argument);
    EXPECT_THROW(registry.add({"empty", "main.c", {}, {"main"}, {"./main"}}), invalid_argument);
    EXPECT_THROW(registry.add({"", "main.c", {"gcc"}, {"main"}, {"./main"}}), invalid_argument);
    EXPECT_TRUE(registry.names().empty());
}

TEST(LanguageTest, LoadTable) {
    filesystem::path config = filesystem::temp_directory_path() / "codegrade-language-test.json";
    write_file_content(config, R"([
        {
            "name": "c",
            "source_file": "solution.c",
            "compile": ["clang", "-o", "solution", "solution.c"],
            "artifacts": ["solution"],
            "run": ["./solution"]
        },
        {
            "name": "bash",
            "source_file": "main.sh",
            "compile": ["bash", "-n", "main.sh"],
            "artifacts": ["main.sh"],
            "run": ["bash", "main.sh"]
        }
    ])");

    language_registry registry = language_registry::defaults();
    registry.load(config);
    filesystem::remove(config);

    EXPECT_THAT(registry.names(), ElementsAre("bash", "c", "cpp", "python3"));
    const language *c = registry.find("c");
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(c->source_file, "solution.c");
    EXPECT_EQ(c->compile_command.front(), "clang");
}

TEST(LanguageTest, MalformedTableIsRejected) {
    filesystem::path config = filesystem::temp_directory_path() / "codegrade-language-malformed.json";
    language_registry registry;

    write_file_content(config, R"({"name": "c"})");
    EXPECT_THROW(registry.load(config), invalid_argument);

    write_file_content(config, R"([{"name": "c", "source_file": "main.c", "compile": "gcc main.c", "artifacts": ["main"], "run": ["./main"]}])");
    try {
        registry.load(config);
        FAIL() << "malformed compile command accepted";
    } catch (invalid_argument &ex) {
        EXPECT_THAT(ex.what(), ::testing::HasSubstr("compile"));
    }

    write_file_content(config, "[");
    EXPECT_THROW(registry.load(config), invalid_argument);

    filesystem::remove(config);
}
