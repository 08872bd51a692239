#include "test_framework.hpp"

#include "clausekit/chunking/dedup.hpp"
#include "clausekit/chunking/flattener.hpp"
#include "clausekit/chunking/splitter.hpp"
#include "clausekit/observability/observer.hpp"
#include "clausekit/structure/hierarchy.hpp"

#include "tests/helpers/test_helpers.hpp"

#include <set>
#include <sstream>
#include <string>

namespace {

namespace ch = clausekit::chunking;
namespace st = clausekit::structure;

ch::Chunked split_ok(std::string_view text, const ch::SplitOptions &options) {
  auto result = ch::split(text, options);
  clausekit::tests::require_ok(result, "split");
  return result.value();
}

ch::Chunked flatten_ok(const st::SectionForest &forest, const ch::FlattenOptions &options) {
  auto result = ch::flatten(forest, options);
  clausekit::tests::require_ok(result, "flatten");
  return result.value();
}

st::SectionForest chapter_with_article() {
  return st::build_hierarchy({
      st::heading_element("第一章 总则", 1),
      st::paragraph_element("content A"),
      st::heading_element("第一条 X", 5),
      st::paragraph_element("content B"),
  });
}

ch::Deduplicator make_dedup(ch::DedupOptions options = {}) {
  auto created = ch::Deduplicator::create(options);
  clausekit::tests::require_ok(created, "Deduplicator::create");
  return created.value();
}

std::size_t word_count(std::string_view text) {
  std::istringstream stream{std::string(text)};
  std::size_t words = 0;
  std::string word;
  while (stream >> word) {
    ++words;
  }
  return words;
}

} // namespace

void register_chunking_tests(std::vector<clausekit::tests::TestCase> &tests) {
  using clausekit::tests::require;
  using clausekit::tests::require_error_contains;
  using clausekit::tests::require_ok;

  // Splitter

  tests.push_back({"split_packs_whole_sentences", [] {
                     const auto out = split_ok("第一条 ABC。第二条 DEF。",
                                               ch::SplitOptions{.max_size = 8, .overlap = 0});
                     require(out.chunks.size() == 2, "two chunks");
                     require(out.chunks[0] == "第一条 ABC。" && out.chunks[1] == "第二条 DEF。",
                             "one sentence per chunk");
                     require(out.diagnostics.empty(), "no degradation");
                   }});

  tests.push_back({"split_keeps_oversized_sentence_whole", [] {
                     clausekit::testing::ObserverCapture capture;
                     const std::string sentence = "一个很长很长很长很长很长很长很长很长的单句没有句号";
                     ch::SplitOptions options;
                     options.max_size = 5;
                     const auto out = split_ok(sentence, options);
                     require(out.chunks.size() == 1 && out.chunks[0] == sentence, "kept verbatim");
                     require(out.diagnostics.size() == 1, "one diagnostic");
                     require(out.diagnostics[0].severity == clausekit::common::Severity::Warning &&
                                 out.diagnostics[0].component == "splitter",
                             "warning from the splitter");
                     require(out.diagnostics[0].message.find("exceeds max_size 5") != std::string::npos,
                             "message names the limit");
                     require(capture.count_events<clausekit::observability::SplitFallbackEvent>() == 1,
                             "fallback event");
                   }});

  tests.push_back({"split_short_circuits_small_text", [] {
                     const std::string text = "第一条 目的。第二条 范围。";
                     for (const bool by_sentence : {true, false}) {
                       for (const std::size_t overlap : {std::size_t{0}, std::size_t{100}, std::size_t{500}}) {
                         const auto out = split_ok(
                             text, ch::SplitOptions{.max_size = 100, .overlap = overlap, .by_sentence = by_sentence});
                         require(out.chunks.size() == 1 && out.chunks[0] == text, "returned unchanged");
                       }
                     }
                     const auto tight = split_ok("abc", ch::SplitOptions{.max_size = 3, .overlap = 3});
                     require(tight.chunks == std::vector<std::string>({"abc"}), "fits exactly");
                     const auto blank = split_ok("   ", ch::SplitOptions{.max_size = 10, .overlap = 0});
                     require(blank.chunks.size() == 1 && blank.chunks[0] == "   ", "blank text unchanged");
                     require(split_ok("", ch::SplitOptions{}).chunks.empty(), "empty text");
                   }});

  tests.push_back({"split_overlap_repeats_whole_trailing_sentences", [] {
                     const auto out = split_ok("甲甲甲。乙乙乙。丙丙丙。",
                                               ch::SplitOptions{.max_size = 8, .overlap = 4});
                     require(out.chunks.size() == 2, "two chunks");
                     require(out.chunks[0] == "甲甲甲。乙乙乙。", "first chunk");
                     require(out.chunks[1] == "乙乙乙。丙丙丙。", "second starts with the last sentence");
                   }});

  tests.push_back({"split_respects_size_bound_or_escape_hatch", [] {
                     const std::string text = "短句一。这是一个明显超过上限而且中间没有任何标点的长句子。"
                                              "短句二。短句三！短句四？最后一句；";
                     const ch::SplitOptions options{.max_size = 10, .overlap = 3};
                     const auto out = split_ok(text, options);
                     require(out.chunks.size() > 2, "text was split");
                     require(out.diagnostics.size() == 1, "only the long sentence is flagged");
                     for (const auto &chunk : out.chunks) {
                       require(text.find(chunk) != std::string::npos, "chunk is a slice: " + chunk);
                       if (ch::character_count(chunk) > options.max_size) {
                         require(ch::split_sentences(chunk).size() == 1,
                                 "only single sentences may exceed the limit: " + chunk);
                       }
                     }
                   }});

  tests.push_back({"split_raw_windows_overlap", [] {
                     const ch::SplitOptions options{.max_size = 4, .overlap = 1, .by_sentence = false};
                     const auto out = split_ok("abcdefghij", options);
                     require(out.chunks == std::vector<std::string>({"abcd", "defg", "ghij"}),
                             "windows share one character");

                     const auto no_overlap =
                         split_ok("abcdefghij", ch::SplitOptions{.max_size = 4, .overlap = 0, .by_sentence = false});
                     require(no_overlap.chunks == std::vector<std::string>({"abcd", "efgh", "ij"}),
                             "adjacent windows");

                     const auto cjk =
                         split_ok("第一条第二条第三条", ch::SplitOptions{.max_size = 3, .overlap = 0, .by_sentence = false});
                     require(cjk.chunks.size() == 3 && cjk.chunks[1] == "第二条", "code point windows");
                   }});

  tests.push_back({"split_rejects_zero_max_size", [] {
                     require_error_contains(ch::split("x", ch::SplitOptions{.max_size = 0, .overlap = 0}),
                                            "max_size must be greater than 0", "zero max");
                   }});

  tests.push_back({"split_caps_overlap_below_max_size", [] {
                     const auto raw = split_ok(
                         "abcdefg", ch::SplitOptions{.max_size = 4, .overlap = 9, .by_sentence = false});
                     require(raw.chunks == std::vector<std::string>({"abcd", "bcde", "cdef", "defg"}),
                             "windows advance one character");

                     const auto packed = split_ok("甲甲。乙乙。丙丙。",
                                                  ch::SplitOptions{.max_size = 6, .overlap = 50});
                     require(packed.chunks == std::vector<std::string>({"甲甲。乙乙。", "乙乙。丙丙。"}),
                             "overlap limited to whole sentences that fit");
                     require(packed.diagnostics.empty(), "no degradation");
                   }});

  tests.push_back({"split_uses_custom_size_function", [] {
                     const ch::SplitOptions options{.max_size = 4, .overlap = 0, .size_fn = word_count};
                     const auto out = split_ok("one two three. four five six. seven eight.", options);
                     require(out.chunks == std::vector<std::string>({"one two three.", "four five six.",
                                                                     "seven eight."}),
                             "packed by word count");
                   }});

  tests.push_back({"split_sentences_handles_numbers_and_closers", [] {
                     const auto amounts = ch::split_sentences("金额为3.5万元。付款期限为30天。");
                     require(amounts.size() == 2 && amounts[0] == "金额为3.5万元。", "decimal point");
                     const auto quoted = ch::split_sentences("他说：“同意。”然后离开。");
                     require(quoted.size() == 2 && quoted[0] == "他说：“同意。”", "closing quote");
                     const auto stacked = ch::split_sentences("真的吗？！是的。  ");
                     require(stacked.size() == 2 && stacked[0] == "真的吗？！" && stacked[1] == "是的。",
                             "terminator run");
                     require(ch::split_sentences("没有终止符").size() == 1, "unterminated tail");
                   }});

  // Flattener

  tests.push_back({"flatten_finest_emits_leaves_with_path", [] {
                     const auto out = flatten_ok(chapter_with_article(), ch::FlattenOptions{});
                     require(out.chunks == std::vector<std::string>({"第一章 总则 > 第一条 X\n\ncontent B"}),
                             "only the leaf contributes");
                   }});

  tests.push_back({"flatten_all_levels_and_parent_only", [] {
                     const auto forest = chapter_with_article();
                     const auto all = ch::flatten(forest, "all_levels");
                     require_ok(all, "all_levels");
                     require(all.value().chunks ==
                                 std::vector<std::string>({"第一章 总则\n\ncontent A",
                                                           "第一章 总则 > 第一条 X\n\ncontent B"}),
                             "every section in pre-order");

                     const auto parent = ch::flatten(forest, "parent_only");
                     const auto finest = ch::flatten(forest, "finest_granularity");
                     require_ok(parent, "parent_only");
                     require_ok(finest, "finest_granularity");
                     require(parent.value().chunks == finest.value().chunks,
                             "parent_only matches finest_granularity");
                   }});

  tests.push_back({"flatten_finest_chunks_are_disjoint", [] {
                     const auto forest = st::build_hierarchy({
                         st::heading_element("第一章", 3),
                         st::heading_element("第一条", 5),
                         st::paragraph_element("甲"),
                         st::heading_element("第二条", 5),
                         st::paragraph_element("乙"),
                         st::heading_element("第二章", 3),
                         st::paragraph_element("丙"),
                     });
                     const auto out = flatten_ok(forest, ch::FlattenOptions{});
                     require(out.chunks == std::vector<std::string>({"第一章 > 第一条\n\n甲",
                                                                     "第一章 > 第二条\n\n乙",
                                                                     "第二章\n\n丙"}),
                             "one chunk per leaf");
                     const std::set<std::string> unique(out.chunks.begin(), out.chunks.end());
                     require(unique.size() == out.chunks.size(), "no repeated chunk");

                     const auto preamble = flatten_ok(
                         st::build_hierarchy({st::paragraph_element("前言内容"), st::paragraph_element("说明")}),
                         ch::FlattenOptions{});
                     require(preamble.chunks == std::vector<std::string>({"前言内容\n\n说明"}),
                             "synthetic root has no prefix");
                   }});

  tests.push_back({"section_chunk_prefixes_foreign_content", [] {
                     const st::Section attachment{.heading = "附件", .content = "表格内容", .level = 6};
                     require(ch::section_chunk(attachment, "合同") == "合同 > 附件\n\n表格内容", "prefixed");
                     require(ch::section_chunk(attachment, "") == "表格内容", "top level keeps content");
                     const st::Section bare{.heading = "附则", .level = 3};
                     require(ch::section_chunk(bare, "第十章") == "第十章 > 附则", "heading only");
                   }});

  tests.push_back({"flatten_strict_sizing_splits_chunks", [] {
                     const auto forest = st::build_hierarchy({
                         st::heading_element("第一条", 5),
                         st::paragraph_element("甲甲甲。乙乙乙。丙丙丙。"),
                     });
                     const auto fitted = flatten_ok(
                         forest, ch::FlattenOptions{.strict_sizing = true,
                                                    .split = {.max_size = 10, .overlap = 0}});
                     require(fitted.chunks == std::vector<std::string>({"第一条\n\n甲甲甲。", "乙乙乙。丙丙丙。"}),
                             "split in place");
                     require(fitted.diagnostics.empty(), "all pieces fit");

                     const auto tight = flatten_ok(
                         forest, ch::FlattenOptions{.strict_sizing = true,
                                                    .split = {.max_size = 6, .overlap = 0}});
                     require(tight.chunks.size() == 3, "three pieces");
                     require(tight.diagnostics.size() == 1, "oversized piece reported");

                     const auto loose = flatten_ok(forest, ch::FlattenOptions{.split = {.max_size = 6, .overlap = 0}});
                     require(loose.chunks.size() == 1, "no splitting without strict sizing");
                   }});

  tests.push_back({"flatten_rejects_bad_configuration", [] {
                     const auto forest = chapter_with_article();
                     require_error_contains(ch::flatten(forest, "by_page"),
                                            "invalid chunking strategy 'by_page'; expected one of: "
                                            "finest_granularity, all_levels, parent_only",
                                            "strategy");
                     require_error_contains(
                         ch::flatten({}, ch::FlattenOptions{.strict_sizing = true,
                                                            .split = {.max_size = 0, .overlap = 0}}),
                         "max_size", "split options checked up front");
                     require(flatten_ok({}, ch::FlattenOptions{}).chunks.empty(), "empty forest");
                     require(ch::strategy_name(ch::Strategy::AllLevels) == "all_levels", "name");
                   }});

  // Deduplicator

  tests.push_back({"dedup_drops_near_duplicate_headers", [] {
                     clausekit::testing::ObserverCapture capture;
                     const auto dedup = make_dedup();
                     const std::vector<std::string> chunks = {
                         "ABC same header text for the payment table",
                         "第一条 付款方式",
                         "ABC same header text for the payment table, row 2",
                     };
                     const auto kept = dedup.dedup(chunks);
                     require(kept == std::vector<std::string>({chunks[0], chunks[1]}), "second header dropped");
                     require(capture.count_metrics<clausekit::observability::DuplicatesDroppedMetric>() == 1,
                             "dropped count recorded");
                   }});

  tests.push_back({"dedup_is_stable", [] {
                     const auto dedup = make_dedup();
                     const std::vector<std::string> chunks = {
                         "甲方应于每月五日前支付租金。", "甲方应于每月五日前支付租金！", "乙方负责维修。",
                         "Table header: name, amount", "table HEADER:  name,   amount", "附件一 清单",
                     };
                     const auto once = dedup.dedup(chunks);
                     require(once.size() < chunks.size(), "something dropped");
                     require(dedup.dedup(once) == once, "second pass is a no-op");
                     require(dedup.dedup({}).empty(), "empty input");
                   }});

  tests.push_back({"dedup_fingerprint_strips_decorations", [] {
                     const auto dedup = make_dedup();
                     require(dedup.fingerprint("【Chunk 1】来源 合同.docx\n第一条  付款 [length: 12]") ==
                                 "第一条 付款",
                             "index line and length tag removed");
                     require(dedup.fingerprint("Chunk 2/5: Payment (Part 3)") == "payment", "part markers");
                     require(dedup.fingerprint("第二条（第2部分）\n" + std::string(60, '=')) == "第二条",
                             "separator rule");
                     const auto kept = dedup.dedup({"[Chunk 1] 第一条 付款", "[Chunk 2] 第一条 付款"});
                     require(kept.size() == 1, "decorations do not make chunks distinct");

                     const auto short_prints = make_dedup(ch::DedupOptions{.fingerprint_length = 5});
                     require(short_prints.fingerprint("ABCDEFG") == "abcde", "prefix length");
                   }});

  tests.push_back({"dedup_fingerprint_folds_full_width_and_latin_capitals", [] {
                     const auto dedup = make_dedup();
                     require(dedup.fingerprint("甲方ＡＢＣ公司") == "甲方ａｂｃ公司", "full-width letters");
                     require(dedup.fingerprint("CAFÉ Ø") == "café ø", "latin-1 letters");
                     require(dedup.fingerprint("3×4") == "3×4", "multiplication sign kept");
                     const auto kept = dedup.dedup({"甲方：ＡＢＣ有限公司", "甲方：ａｂｃ有限公司"});
                     require(kept.size() == 1, "case variants are duplicates");
                   }});

  tests.push_back({"jaccard_similarity_over_distinct_characters", [] {
                     require(ch::jaccard_similarity("", "") == 1.0, "both empty");
                     require(ch::jaccard_similarity("abc", "") == 0.0, "one empty");
                     require(ch::jaccard_similarity("aab", "abb") == 1.0, "multiplicity ignored");
                     require(ch::jaccard_similarity("第一", "一第") == 1.0, "order ignored");
                     require(ch::jaccard_similarity("ab", "bc") == 1.0 / 3.0, "partial overlap");
                   }});

  tests.push_back({"dedup_threshold_bounds", [] {
                     require_error_contains(ch::Deduplicator::create(ch::DedupOptions{.threshold = 1.5}),
                                            "dedup threshold must be within [0, 1]", "above one");
                     require(!ch::Deduplicator::create(ch::DedupOptions{.threshold = -0.1}).ok(), "negative");

                     const auto strict = make_dedup(ch::DedupOptions{.threshold = 1.0});
                     require(strict.dedup({"ab", "ba", "abc"}).size() == 2, "only identical sets dropped");
                     const auto greedy = make_dedup(ch::DedupOptions{.threshold = 0.0});
                     require(greedy.dedup({"ab", "xy", "z"}).size() == 1, "everything after the first");
                   }});
}
