#include "test_framework.hpp"

#include "trustgate/common/base64.hpp"
#include "trustgate/common/fs.hpp"
#include "trustgate/common/json_util.hpp"
#include "trustgate/common/result.hpp"
#include "trustgate/common/toml.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <stdexcept>

void register_common_tests(std::vector<trustgate::tests::TestCase> &tests) {
  using trustgate::tests::require;
  namespace common = trustgate::common;

  tests.push_back({"common_trim_and_lower", [] {
                     require(common::trim("  hi \n") == "hi", "trim failed");
                     require(common::to_lower("Image/PNG") == "image/png", "lower failed");
                     require(common::starts_with("ZPLUS:v1:abc", "ZPLUS:v1:"), "prefix");
                     require(!common::ends_with("a", "abc"), "suffix longer than value");
                   }});

  tests.push_back({"common_result_value_of_failure_throws", [] {
                     const auto failed = common::Result<int>::failure("boom");
                     require(!failed.ok(), "should fail");
                     require(failed.error() == "boom", "error text");
                     require(failed.value_or(7) == 7, "fallback");
                     bool threw = false;
                     try {
                       (void)failed.value();
                     } catch (const std::logic_error &) {
                       threw = true;
                     }
                     require(threw, "value() of a failure should throw");
                   }});

  tests.push_back({"common_base64_known_vectors", [] {
                     const std::string text = "hello";
                     const std::vector<unsigned char> bytes(text.begin(), text.end());
                     require(common::base64_encode(bytes) == "aGVsbG8=", "encode hello");
                     require(common::base64_encode({}).empty(), "empty encodes to empty");

                     const auto decoded = common::base64_decode("aGVsbG8=");
                     require(decoded.ok(), decoded.error());
                     require(decoded.value() == bytes, "decode hello");

                     const auto two_pad = common::base64_decode("aGk=\n");
                     require(two_pad.ok() && two_pad.value().size() == 2, "whitespace tolerated");
                   }});

  tests.push_back({"common_base64_rejects_bad_length", [] {
                     const auto decoded = common::base64_decode("abc");
                     require(!decoded.ok(), "three characters is not base64");
                   }});

  tests.push_back({"common_json_parse_fields_keeps_kinds", [] {
                     const auto fields = common::json_parse_fields(
                         R"({"id":"q1","n":3,"ok":true,"none":null,"obj":{"a":1},"arr":[1,2]})");
                     require(fields.has_value(), "should parse");
                     require(fields->at("id").kind == common::JsonKind::String, "string kind");
                     require(fields->at("id").value == "q1", "string value");
                     require(fields->at("n").kind == common::JsonKind::Number, "number kind");
                     require(fields->at("ok").kind == common::JsonKind::Bool, "bool kind");
                     require(fields->at("none").kind == common::JsonKind::Null, "null kind");
                     require(fields->at("obj").kind == common::JsonKind::Object, "object kind");
                     require(fields->at("arr").value == "[1,2]", "raw array text");
                   }});

  tests.push_back({"common_json_parse_fields_rejects_garbage", [] {
                     require(!common::json_parse_fields("[1,2]").has_value(), "array is not object");
                     require(!common::json_parse_fields(R"({"a":1} trailing)").has_value(),
                             "trailing text");
                     require(!common::json_parse_fields(R"({"a" 1})").has_value(), "missing colon");
                   }});

  tests.push_back({"common_json_split_array_elements", [] {
                     const auto parts = common::json_split_array(R"([{"a":"x,y"}, "s", 4])");
                     require(parts.size() == 3, "three elements");
                     require(parts[0] == R"({"a":"x,y"})", "object element intact");
                     require(parts[1] == R"("s")", "string element");
                   }});

  tests.push_back({"common_json_unescape_unicode", [] {
                     require(common::json_unescape(R"(caf\u00e9\n)") == "caf\xC3\xA9\n",
                             "unicode escape to utf-8");
                   }});

  tests.push_back({"common_toml_sections_and_separators", [] {
                     const auto doc = common::parse_toml(R"(
# comment
[intake]
max_file_bytes = 15_728_640
allowed_url_mime_types = ["application/pdf", "image/png"]

[observability]
backend = "none" # trailing comment
)");
                     require(doc.ok(), doc.error());
                     require(doc.value().get_u64("intake.max_file_bytes", 0) == 15728640,
                             "digit separators");
                     require(doc.value().get_string("observability.backend") == "none",
                             "quoted string");
                     require(doc.value().get_string_array("intake.allowed_url_mime_types").size() == 2,
                             "string array");
                   }});

  tests.push_back({"common_toml_rejects_bare_line", [] {
                     const auto doc = common::parse_toml("[scanner]\njust words\n");
                     require(!doc.ok(), "line without '=' should fail");
                   }});

  tests.push_back({"common_toml_reports_bad_values_with_line", [] {
                     const auto doc = common::parse_toml("[scanner]\npoll_attempts = 7\n"
                                                         "timeout_ms = 12ab\n");
                     require(!doc.ok(), "malformed integer rejected");
                     require(doc.error() == "Invalid value at line 3", doc.error());

                     const auto mixed = common::parse_toml("[intake]\nallowed = [\"a\", 1]\n");
                     require(!mixed.ok(), "non-string array element rejected");

                     const auto twice = common::parse_toml("[a]\nk = 1\nk = 2\n");
                     require(!twice.ok() && twice.error() == "Duplicate key a.k at line 3",
                             "duplicate key");
                   }});

  tests.push_back({"common_toml_string_escapes_round_trip", [] {
                     const std::string original = "say \"hi\" \\ then\nnewline";
                     const auto doc =
                         common::parse_toml("key = " + common::quote_toml_string(original) + "\n");
                     require(doc.ok(), doc.error());
                     require(doc.value().get_string("key") == original, "escapes preserved");
                     require(doc.value().get_u64("key", 9) == 9, "wrong type falls back");

                     const auto hash = common::parse_toml(R"(url = "http://x/#frag" # note)");
                     require(hash.ok() && hash.value().get_string("url") == "http://x/#frag",
                             "hash inside string kept");
                   }});

  tests.push_back({"common_read_file_bytes_missing", [] {
                     trustgate::testing::TempWorkspace workspace;
                     const auto bytes = common::read_file_bytes(workspace.path() / "absent.pdf");
                     require(!bytes.ok(), "missing file should fail");

                     workspace.create_file("present.txt", "abc");
                     const auto present = common::read_file_bytes(workspace.path() / "present.txt");
                     require(present.ok() && present.value().size() == 3, "reads bytes");
                   }});
}
