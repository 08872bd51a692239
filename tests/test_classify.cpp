#include "test_framework.hpp"

#include "clausekit/classify/factory.hpp"
#include "clausekit/classify/rule_based.hpp"
#include "clausekit/config/schema.hpp"

#include <memory>
#include <string>

namespace {

std::shared_ptr<const clausekit::classify::RuleBasedClassifier>
make_classifier(clausekit::classify::ClassifierOptions options = {}) {
  auto created = clausekit::classify::RuleBasedClassifier::create(std::move(options));
  clausekit::tests::require_ok(created, "RuleBasedClassifier::create");
  return created.value();
}

void require_heading(const clausekit::classify::IHeadingClassifier &classifier,
                     const std::string &text, const clausekit::classify::HeadingLevel level) {
  const auto result = classifier.classify(text);
  clausekit::tests::require(result.is_heading, "expected heading: " + text);
  clausekit::tests::require(result.level == clausekit::classify::level_value(level),
                            "wrong level " + std::to_string(result.level) + " for: " + text);
}

void require_plain(const clausekit::classify::IHeadingClassifier &classifier,
                   const std::string &text) {
  const auto result = classifier.classify(text);
  clausekit::tests::require(!result.is_heading, "expected plain content: " + text);
  clausekit::tests::require(result.level == clausekit::classify::kDefaultLevel,
                            "plain content keeps the default level: " + text);
}

} // namespace

void register_classify_tests(std::vector<clausekit::tests::TestCase> &tests) {
  using clausekit::tests::require;
  using clausekit::tests::require_error_contains;
  using clausekit::tests::require_ok;
  namespace cl = clausekit::classify;
  using cl::HeadingLevel;

  tests.push_back({"article_heading_and_long_article_body", [] {
                     const auto classifier = make_classifier();
                     require_heading(*classifier, "第一条 为了规范…", HeadingLevel::Article);
                     require_plain(*classifier, "第一条的内容很长，包含了很多详细的规定和说明。");
                     require(classifier->classify("第一条 为了规范…").confidence == 1.0,
                             "rule-based confidence is 1");
                   }});

  tests.push_back({"article_longer_than_limit_is_content", [] {
                     const auto classifier = make_classifier();
                     std::string text = "第十二条 ";
                     for (int i = 0; i < 50; ++i) {
                       text += "甲";
                     }
                     require_plain(*classifier, text);

                     cl::ClassifierOptions relaxed;
                     relaxed.article_max_length = 100;
                     require_heading(*make_classifier(relaxed), text, HeadingLevel::Article);
                   }});

  tests.push_back({"legal_levels_in_table_order", [] {
                     const auto classifier = make_classifier();
                     require_heading(*classifier, "第一编 总则", HeadingLevel::Book);
                     require_heading(*classifier, "第二篇 分则", HeadingLevel::Part);
                     require_heading(*classifier, "第三章 合同的履行", HeadingLevel::Chapter);
                     require_heading(*classifier, "第1节 一般规定", HeadingLevel::Section);
                     require_heading(*classifier, "第二款 付款", HeadingLevel::Clause);
                     require_heading(*classifier, "第三项 交付", HeadingLevel::Item);
                     require_heading(*classifier, "第四目 验收", HeadingLevel::SubItem);
                     require_heading(*classifier, "（一）甲方责任", HeadingLevel::Enumeration);
                     require_heading(*classifier, "(2) 乙方责任", HeadingLevel::Enumeration);
                     require_heading(*classifier, "三、违约责任", HeadingLevel::Enumeration);
                     require_heading(*classifier, "1. 定义", HeadingLevel::Numbering);
                     require_heading(*classifier, "2.3 付款方式", HeadingLevel::Numbering);
                     require_heading(*classifier, "4) 附件", HeadingLevel::Numbering);
                   }});

  tests.push_back({"length_bounds", [] {
                     const auto classifier = make_classifier();
                     require_plain(*classifier, "");
                     require_plain(*classifier, "章");
                     require_plain(*classifier, "   \n");
                     require_plain(*classifier, "第一章" + std::string(600, 'x'));
                   }});

  tests.push_back({"generic_numbering_for_non_legal_documents", [] {
                     const auto classifier = make_classifier();
                     require_heading(*classifier, "Chapter 3 Definitions", HeadingLevel::Chapter);
                     require_heading(*classifier, "Section 12 Payment", HeadingLevel::Section);
                     require_heading(*classifier, "article 7 termination", HeadingLevel::Article);

                     cl::ClassifierOptions legal;
                     legal.document_type = cl::DocumentType::Legal;
                     const auto legal_classifier = make_classifier(legal);
                     require_plain(*legal_classifier, "Chapter 3 Definitions");
                     require_plain(*legal_classifier, "合同双方");
                     require_heading(*legal_classifier, "第三章 附则", HeadingLevel::Chapter);
                   }});

  tests.push_back({"fuzzy_fallback_for_short_titles", [] {
                     const auto classifier = make_classifier();
                     const auto title = classifier->classify("合同双方");
                     require(title.is_heading && title.level == cl::kDefaultLevel, "short title");
                     require_plain(*classifier, "本合同自双方签字之日起生效。");
                     require_plain(*classifier, "甲方，乙方");
                     require_plain(*classifier, "付款内容");
                     require_plain(*classifier, "本合同一式两份双方各执一份并具有同等法律效力和约束力自签字盖章之日起生效");

                     cl::ClassifierOptions strict;
                     strict.enable_fuzzy_matching = false;
                     require_plain(*make_classifier(strict), "合同双方");
                   }});

  tests.push_back({"custom_patterns_extend_categories", [] {
                     cl::ClassifierOptions options;
                     options.custom_patterns["article"] = {"^Art\\.\\s*\\d+"};
                     options.custom_patterns["chinese_numbering"] = {"[ⅠⅡⅢⅣⅤ]+、"};
                     const auto classifier = make_classifier(options);
                     require_heading(*classifier, "Art. 5 Scope", HeadingLevel::Article);
                     require_heading(*classifier, "Ⅱ、付款", HeadingLevel::Enumeration);
                   }});

  tests.push_back({"custom_pattern_errors_fail_creation", [] {
                     cl::ClassifierOptions bad_regex;
                     bad_regex.custom_patterns["article"] = {"第(条"};
                     require_error_contains(cl::RuleBasedClassifier::create(bad_regex),
                                            "invalid article pattern", "bad regex");

                     cl::ClassifierOptions bad_category;
                     bad_category.custom_patterns["headline"] = {"^H\\d"};
                     require_error_contains(cl::RuleBasedClassifier::create(bad_category),
                                            "unknown custom pattern category 'headline'",
                                            "bad category");
                   }});

  tests.push_back({"level_names_round_trip", [] {
                     require(cl::level_name(HeadingLevel::SubItem) == "subitem", "name");
                     require(cl::level_from_name("chapter") == HeadingLevel::Chapter, "parse");
                     require(!cl::level_from_name("volume").has_value(), "unknown");
                     require_ok(cl::parse_document_type("Contract"), "document type");
                     require(!cl::parse_document_type("novel").ok(), "unknown document type");
                   }});

  tests.push_back({"extract_sections_splits_on_markers", [] {
                     const auto classifier = make_classifier();
                     const std::string text =
                         "前言\n第一章 总则\n第一条 目的。\n本条说明适用范围。\n  第二条 范围。";
                     const auto spans = classifier->extract_sections(text);
                     require(spans.size() == 3, "three markers");
                     require(spans[0].heading == "第一章" &&
                                 spans[0].level == cl::level_value(HeadingLevel::Chapter),
                             "chapter span");
                     require(spans[0].content == "第一章 总则", "chapter content");
                     require(spans[0].start == std::string("前言\n").size(), "byte offset");
                     require(spans[1].content == "第一条 目的。\n本条说明适用范围。",
                             "article spans until the next marker");
                     require(spans[2].heading == "第二条" && spans[2].end == text.size(), "last span");
                     require(text.substr(spans[1].start, 3) == "第", "start points at marker");
                   }});

  tests.push_back({"clean_legal_text_strips_breadcrumbs", [] {
                     require(cl::clean_legal_text("民法典 > 第一条  为了\n\n规范") ==
                                 "第一条 为了 规范",
                             "title breadcrumb");
                     require(cl::clean_legal_text("（征求意见稿） > 第二条 内容") == "第二条 内容",
                             "draft breadcrumb");
                     require(cl::clean_legal_text("  plain   text ") == "plain text", "whitespace");
                   }});

  tests.push_back({"factory_builds_rule_classifier_from_config", [] {
                     clausekit::config::Config config;
                     config.classifier.document_type = "legal";
                     const auto created = cl::create_classifier(config);
                     require_ok(created, "create_classifier");
                     require(created.value()->name() == "rule", "rule backend");
                     require_plain(*created.value(), "Chapter 3 Definitions");

                     config.classifier.document_type = "novel";
                     require(!cl::create_classifier(config).ok(), "bad document type");
                   }});
}
