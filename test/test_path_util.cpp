#include <string>

#include "slokit/path_util.h"
#include "test.h"

using namespace slokit::normalizer;

#define PATH_UTIL_TEST(x) TEST_CASE(x, "[path_util]")

PATH_UTIL_TEST("clean_path matches lexical path cleaning") {
  struct TestCase {
    std::string input;
    std::string expected;
  };

  auto test_case = GENERATE(values<TestCase>({
      // already clean
      {"", "."},
      {"abc", "abc"},
      {"abc/def", "abc/def"},
      {"a/b/c", "a/b/c"},
      {".", "."},
      {"..", ".."},
      {"../..", "../.."},
      {"../../abc", "../../abc"},
      {"/abc", "/abc"},
      {"/", "/"},

      // remove trailing slash
      {"abc/", "abc"},
      {"abc/def/", "abc/def"},
      {"./", "."},
      {"../", ".."},
      {"/abc/", "/abc"},

      // remove doubled slash
      {"abc//def//ghi", "abc/def/ghi"},
      {"//abc", "/abc"},
      {"///abc", "/abc"},
      {"//abc//", "/abc"},
      {"abc//", "abc"},
      {"////", "/"},

      // remove . elements
      {"abc/./def", "abc/def"},
      {"/./abc/def", "/abc/def"},
      {"abc/.", "abc"},

      // remove .. elements
      {"abc/def/ghi/../jkl", "abc/def/jkl"},
      {"abc/def/../ghi/../jkl", "abc/jkl"},
      {"abc/def/..", "abc"},
      {"abc/def/../..", "."},
      {"/abc/def/../..", "/"},
      {"abc/def/../../..", ".."},
      {"/abc/def/../../..", "/"},
      {"abc/def/../../../ghi/jkl/../../../mno", "../../mno"},

      // combinations
      {"abc/./../def", "def"},
      {"abc//./../def", "def"},
      {"abc/../../././../def", "../../def"},
  }));

  CAPTURE(test_case.input);
  REQUIRE(clean_path(test_case.input) == test_case.expected);
}

PATH_UTIL_TEST("clean_path is idempotent") {
  auto input = GENERATE(as<std::string>{}, "", "/a//b/../c/", "../x/./y",
                        "/..", "a/b/c/../../..");
  const std::string once = clean_path(input);
  CAPTURE(input);
  REQUIRE(clean_path(once) == once);
}

PATH_UTIL_TEST("dot-like names are not special") {
  CHECK(clean_path("/a/.../b") == "/a/.../b");
  CHECK(clean_path("/a/..b/c") == "/a/..b/c");
  CHECK(clean_path("/a/.b/../c") == "/a/c");
}
