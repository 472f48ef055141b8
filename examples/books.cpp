//===- books.cpp - Decode a list of books with flexible author fields -----===//
//
// Each book's "authors" member is either a free-form string or a struct with
// first_name/last_name. Reads a JSON document from the given file (or a
// built-in sample) and prints one author line per book.
//
//===----------------------------------------------------------------------===//

#include "either/either.h"

#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

namespace {

struct Authors {
  std::string first_name;
  std::string last_name;
};

void from_value(const either::Value &value, Authors &out) {
  either::expectMap(value, "struct Authors");
  either::readField(value, "first_name", out.first_name);
  either::readField(value, "last_name", out.last_name);
}

struct Book {
  either::StringOrStruct<Authors> authors;
};

void from_value(const either::Value &value, Book &out) {
  either::expectMap(value, "struct Book");
  either::readField(value, "authors", out.authors);
}

constexpr const char *kSample = R"([
  { "authors": { "first_name": "John", "last_name": "Smith" } },
  { "authors": "Michael J. Smith" }
])";

std::string authorLine(const Book &book) {
  if (const auto *name = book.authors.asString())
    return *name;
  const Authors *a = book.authors.asStruct();
  return a->first_name + " " + a->last_name;
}

} // namespace

int main(int argc, char *argv[]) {
  std::string text = kSample;
  if (argc > 1) {
    std::ifstream in(argv[1]);
    if (!in) {
      std::cerr << "Error: cannot open " << argv[1] << "\n";
      return 1;
    }
    text.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  }

  try {
    either::JsonOptions opts;
    opts.ignore_comments = true;
    auto books = either::fromJson<std::vector<Book>>(text, opts);
    for (const auto &book : books)
      std::cout << authorLine(book) << "\n";
  } catch (const either::Error &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
