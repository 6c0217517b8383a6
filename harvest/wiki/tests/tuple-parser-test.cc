// Copyright 2017 Google Inc.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include <string>
#include <vector>

#include "harvest/base/init.h"
#include "harvest/base/logging.h"
#include "harvest/stream/input.h"
#include "harvest/stream/memory.h"
#include "harvest/wiki/errors.h"
#include "harvest/wiki/link-counts.h"
#include "harvest/wiki/tuple-parser.h"

using namespace harvest;
using namespace harvest::wiki;

static const TupleSchema kTitleSchema{UNSIGNED_FIELD, SIGNED_FIELD,
                                      TITLE_FIELD};
static const TupleSchema kStringSchema{SIGNED_FIELD, STRING_FIELD};

// Tuple parser that collects the tuples as strings.
class TupleCollector : public TupleParser {
 public:
  explicit TupleCollector(const TupleSchema &schema)
      : TupleParser(schema), schema_(schema) {}

  Status Process(const Tuple &tuple) override {
    string str;
    for (int i = 0; i < schema_.size(); ++i) {
      if (i > 0) str.push_back('|');
      switch (schema_.field(i)) {
        case UNSIGNED_FIELD:
          str.append(std::to_string(tuple.unsigned_value(i)));
          break;
        case SIGNED_FIELD:
          str.append(std::to_string(tuple.signed_value(i)));
          break;
        case STRING_FIELD:
        case TITLE_FIELD:
          str.append(tuple.string_value(i));
          break;
      }
    }
    tuples.push_back(str);
    return Status::OK;
  }

  std::vector<string> tuples;

 private:
  const TupleSchema &schema_;
};

Status ParseTuples(const string &data, TupleParser *parser) {
  StringInputStream stream(data, 7);
  Input input(&stream);
  return parser->Parse(&input);
}

void TestTuples() {
  TupleCollector parser(kTitleSchema);
  CHECK(ParseTuples("(123,0,'Example_Page'),(456,1,'Another_Example'),"
                    "(789,-1,'Test_Article'),(1,-2,'X');", &parser));
  CHECK_EQ(parser.num_tuples(), 4);
  CHECK_EQ(parser.tuples.size(), 4);
  CHECK_EQ(parser.tuples[0], "123|0|Example Page");
  CHECK_EQ(parser.tuples[1], "456|1|Another Example");
  CHECK_EQ(parser.tuples[2], "789|-1|Test Article");
  CHECK_EQ(parser.tuples[3], "1|-2|X");
}

void TestEscapes() {
  TupleCollector titles(kTitleSchema);
  CHECK(ParseTuples("(123,0,'Example\\'Page'),(5,0,'A\\_B_C'),"
                    "(6,0,'Back\\\\slash'),(7,0,'Paren(s),\\'x\\'')",
                    &titles));
  CHECK_EQ(titles.tuples.size(), 4);
  CHECK_EQ(titles.tuples[0], "123|0|Example'Page");
  CHECK_EQ(titles.tuples[1], "5|0|A_B C");
  CHECK_EQ(titles.tuples[2], "6|0|Back\\slash");
  CHECK_EQ(titles.tuples[3], "7|0|Paren(s),'x'");

  // Underscores are only folded in title fields. Escaped characters are
  // taken literally.
  TupleCollector strings(kStringSchema);
  CHECK(ParseTuples("(-5,'a_b\\n'),(0,'')", &strings));
  CHECK_EQ(strings.tuples.size(), 2);
  CHECK_EQ(strings.tuples[0], "-5|a_bn");
  CHECK_EQ(strings.tuples[1], "0|");
}

void TestStatements() {
  // Bytes between tuples and statements are skipped.
  TupleCollector parser(kTitleSchema);
  CHECK(ParseTuples("(1,0,'A'),(2,0,'B');\n"
                    "INSERT INTO `linktarget` VALUES (3,0,'C');\n"
                    "UNLOCK TABLES;\n", &parser));
  CHECK_EQ(parser.tuples.size(), 3);
  CHECK_EQ(parser.tuples[2], "3|0|C");
}

void TestErrors() {
  {
    TupleCollector parser(kTitleSchema);
    Status st = ParseTuples("(1,0,'A'),(x,0,'B')", &parser);
    CHECK_EQ(st.code(), UNEXPECTED_TUPLE_BYTE);
    CHECK_EQ(parser.tuples.size(), 1);
  }
  {
    // Minus sign in unsigned field.
    TupleCollector parser(kTitleSchema);
    CHECK_EQ(ParseTuples("(-1,0,'A')", &parser).code(),
             UNEXPECTED_TUPLE_BYTE);
  }
  {
    // Minus sign after digits.
    TupleCollector parser(kTitleSchema);
    CHECK_EQ(ParseTuples("(1,0-1,'A')", &parser).code(),
             UNEXPECTED_TUPLE_BYTE);
  }
  {
    // Double minus sign.
    TupleCollector parser(kTitleSchema);
    CHECK_EQ(ParseTuples("(1,--1,'A')", &parser).code(),
             UNEXPECTED_TUPLE_BYTE);
  }
  {
    // Unquoted string.
    TupleCollector parser(kTitleSchema);
    CHECK_EQ(ParseTuples("(1,0,A)", &parser).code(), UNEXPECTED_TUPLE_BYTE);
  }
  {
    // Too few fields.
    TupleCollector parser(kTitleSchema);
    CHECK_EQ(ParseTuples("(1,0)", &parser).code(), UNEXPECTED_TUPLE_BYTE);
  }
  {
    // Too many fields.
    TupleCollector parser(kTitleSchema);
    CHECK_EQ(ParseTuples("(1,0,'A',2)", &parser).code(),
             UNEXPECTED_TUPLE_BYTE);
  }
  {
    // Input ends inside tuple.
    TupleCollector parser(kTitleSchema);
    CHECK_EQ(ParseTuples("(1,0,'A'),(2,0,'B", &parser).code(),
             TRUNCATED_TUPLE);
  }
}

void TestSkipUntilPrefix() {
  string data = "-- MySQL dump\nCREATE TABLE `linktarget` (\n"
                "  `lt_id` bigint(20) unsigned NOT NULL\n);\n"
                "INSERT INTO `linktarget` VALUES (1,0,'A');\n";
  StringInputStream stream(data, 5);
  Input input(&stream);
  CHECK(SkipUntilPrefix(&input, kLinkTargetPreamble));
  TupleCollector parser(kTitleSchema);
  CHECK(parser.Parse(&input));
  CHECK_EQ(parser.tuples.size(), 1);
  CHECK_EQ(parser.tuples[0], "1|0|A");

  // Partial matches of the prefix.
  string repeated = "INSERT INTO `pagelINSERT INTO `pagelinks` VALUES (1,0,2)";
  StringInputStream partial(repeated, 3);
  Input partial_input(&partial);
  CHECK(SkipUntilPrefix(&partial_input, kPageLinkPreamble));
  CHECK_EQ(partial_input.Peek(), '(');

  string other = "INSERT INTO `pagelinks` VALUES (1,0,2)";
  StringInputStream missing(other);
  Input missing_input(&missing);
  CHECK_EQ(SkipUntilPrefix(&missing_input, kLinkTargetPreamble).code(),
           MISSING_PREAMBLE);
}

void TestLinkTables() {
  TrackedPageMap pages;
  pages[PageName("Example Page")] = "entities/Example Page.wikitext";
  pages[PageName("Another Example")] = "entities/Another Example.wikitext";
  pages[PageName("Test Article")] = "entities/Test Article.wikitext";

  LinkTargetMap targets;
  LinkTargetParser targets_parser(&pages, &targets);
  CHECK(ParseTuples("(123,0,'Example_Page'),(456,1,'Another_Example'),"
                    "(789,-1,'Test_Article'),(124,0,'Untracked_Page')",
                    &targets_parser));
  CHECK_EQ(targets_parser.num_tuples(), 4);
  CHECK_EQ(targets_parser.num_matches(), 1);
  CHECK_EQ(targets.size(), 1);
  CHECK(targets[123] == PageName("Example Page"));

  targets[456] = PageName("Another Example");
  targets[789] = PageName("Test Article");
  LinkCountMap counts;
  PageLinkParser links_parser(&targets, &counts);
  CHECK(ParseTuples("(1,0,123),(2,0,456),(3,0,789);", &links_parser));
  CHECK_EQ(counts.size(), 3);
  CHECK_EQ(counts[PageName("Example Page")], 1);
  CHECK_EQ(counts[PageName("Another Example")], 1);
  CHECK_EQ(counts[PageName("Test Article")], 1);

  // Links to pages without link targets are not counted.
  targets.erase(456);
  LinkCountMap partial;
  PageLinkParser partial_parser(&targets, &partial);
  CHECK(ParseTuples("(1,0,123),(2,0,456),(3,0,789),(4,0,123);",
                    &partial_parser));
  CHECK_EQ(partial_parser.num_matches(), 3);
  CHECK_EQ(partial.size(), 2);
  CHECK_EQ(partial[PageName("Example Page")], 2);
  CHECK_EQ(partial[PageName("Test Article")], 1);
  CHECK_EQ(partial.count(PageName("Another Example")), 0);
}

int main(int argc, char *argv[]) {
  InitProgram(&argc, &argv);

  TestTuples();
  TestEscapes();
  TestStatements();
  TestErrors();
  TestSkipUntilPrefix();
  TestLinkTables();

  LOG(INFO) << "PASS";
  return 0;
}
