#include <gtest/gtest.h>

#include "document/document_parser.hpp"
#include "errors.hpp"

#include <cstdint>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

using rsvp_reader::DocumentParseError;
using rsvp_reader::ordered_page_texts;
using rsvp_reader::PageTextMap;
using rsvp_reader::PlainTextParser;

namespace {

std::vector<std::uint8_t> bytes_of(const std::string& s) {
  return std::vector<std::uint8_t>(s.begin(), s.end());
}

std::vector<std::uint8_t> read_test_file(const std::string& name) {
  std::ifstream f(std::string(RSVP_READER_TEST_DATA_DIR) + "/" + name, std::ios::binary);
  return std::vector<std::uint8_t>((std::istreambuf_iterator<char>(f)),
                                   std::istreambuf_iterator<char>());
}

}  // namespace

// ---------------------------------------------------------------------------
// Page splitting
// ---------------------------------------------------------------------------

TEST(PlainTextParser, TextWithoutFormFeedIsOnePage) {
  PlainTextParser parser;
  auto pages = parser.parse(bytes_of("just one page\nof text"));
  ASSERT_EQ(pages.size(), 1u);
  EXPECT_EQ(pages.at(1), "just one page\nof text");
}

TEST(PlainTextParser, FormFeedStartsNewPage) {
  PlainTextParser parser;
  auto pages = parser.parse(bytes_of("one\ftwo\fthree"));
  ASSERT_EQ(pages.size(), 3u);
  EXPECT_EQ(pages.at(1), "one");
  EXPECT_EQ(pages.at(2), "two");
  EXPECT_EQ(pages.at(3), "three");
}

TEST(PlainTextParser, KeepsBlankPages) {
  PlainTextParser parser;
  auto pages = parser.parse(bytes_of("a\f\f b"));
  ASSERT_EQ(pages.size(), 3u);
  EXPECT_EQ(pages.at(2), "");
}

TEST(PlainTextParser, ParsesFileFromDisk) {
  PlainTextParser parser;
  auto pages = parser.parse(read_test_file("sparse_pages.txt"));
  EXPECT_EQ(pages.size(), 5u);
  EXPECT_EQ(pages.at(5), "End of story.\n");
}

// ---------------------------------------------------------------------------
// Failures
// ---------------------------------------------------------------------------

TEST(PlainTextParser, RejectsEmptyBuffer) {
  PlainTextParser parser;
  EXPECT_THROW(parser.parse({}), DocumentParseError);
}

TEST(PlainTextParser, RejectsBinaryData) {
  PlainTextParser parser;
  std::vector<std::uint8_t> pdfish{'%', 'P', 'D', 'F', 0x00, 0x01, 0xff};
  EXPECT_THROW(parser.parse(pdfish), DocumentParseError);
}

// ---------------------------------------------------------------------------
// Ordering
// ---------------------------------------------------------------------------

TEST(PlainTextParser, OrderedPageTextsSortsByPageNumber) {
  PageTextMap pages;
  pages[10] = "ten";
  pages[2] = "two";
  pages[7] = "seven";
  EXPECT_EQ(ordered_page_texts(pages), (std::vector<std::string>{"two", "seven", "ten"}));
}
