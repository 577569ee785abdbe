#include "lib.cpp" // Include the implementation directly for testing

// Release builds define NDEBUG; the checks below must still run
#undef NDEBUG
#include <cassert>
#include <filesystem>
#include <functional> // For std::function
#include <iostream>   // For std::cerr, std::cout, std::endl
#include <sstream>    // For std::stringstream
#include <string>
#include <vector>

const std::string TEST_DIR_NAME = "test_dir_linecat"; // Use a unique name
const fs::path TEST_DIR_PATH = fs::absolute(TEST_DIR_NAME);

// --- Helper Functions for Testing ---

void cleanup_test_directories() {
  std::error_code ec;
  fs::remove_all(TEST_DIR_PATH, ec);
  fs::remove("test_output.txt", ec);
}

// Creates a test file, ensuring parent directory exists
void create_test_file(const fs::path &absolute_path,
                      const std::string &content) {
  try {
    if (absolute_path.has_parent_path()) {
      fs::create_directories(absolute_path.parent_path());
    }
    std::ofstream file(absolute_path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
      std::cerr << "Error creating test file: " << normalize_path(absolute_path)
                << std::endl;
      return;
    }
    file << content;
  } catch (const std::exception &e) {
    std::cerr << "Exception creating test file "
              << normalize_path(absolute_path) << ": " << e.what() << std::endl;
  }
}

std::string read_file(const fs::path &path) {
  std::ifstream ifs(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(ifs)),
                     std::istreambuf_iterator<char>());
}

// In-memory source; each open yields a fresh stream over `content`
Source string_source(const std::string &name, const std::string &content) {
  return Source{name, [content]() {
                  return std::unique_ptr<std::istream>(
                      std::make_unique<std::istringstream>(content));
                }};
}

std::vector<Source> string_sources(const std::vector<std::string> &contents) {
  std::vector<Source> sources;
  for (size_t i = 0; i < contents.size(); ++i) {
    sources.push_back(string_source("mem" + std::to_string(i), contents[i]));
  }
  return sources;
}

std::string concat_strings(const std::vector<std::string> &contents,
                           const ConcatOptions &options) {
  std::atomic<bool> stop{false};
  std::ostringstream out;
  concatenate_sources(string_sources(contents), options, out, stop);
  return out.str();
}

// Hands out `data`, then fails the next read
class FailingBuffer : public std::streambuf {
public:
  explicit FailingBuffer(std::string data) : data_(std::move(data)) {
    setg(data_.data(), data_.data(), data_.data() + data_.size());
  }

protected:
  int_type underflow() override {
    throw std::runtime_error("simulated device error");
  }

private:
  std::string data_;
};

class FailingStream : public std::istream {
public:
  explicit FailingStream(std::string data)
      : std::istream(nullptr), buffer_(std::move(data)) {
    rdbuf(&buffer_);
  }

private:
  FailingBuffer buffer_;
};

// Counts how many of its instances are alive
class TrackedStream : public std::istringstream {
public:
  TrackedStream(std::string content, int &live)
      : std::istringstream(std::move(content)), live_(live) {
    ++live_;
  }
  ~TrackedStream() override { --live_; }

private:
  int &live_;
};

// --- Test Functions ---

void test_trim() {
  std::cout << "Test: Trim..." << std::flush;
  assert(trim("  hello  ") == "hello");
  assert(trim("\tworld\r\n") == "world");
  assert(trim("") == "");
  std::cout << " Passed\n";
}

void test_read_line() {
  std::cout << "Test: Read line keeps terminators..." << std::flush;
  std::istringstream in("a\n\nlast");
  std::string line;
  assert(read_line(in, line) && line == "a\n");
  assert(read_line(in, line) && line == "\n");
  assert(read_line(in, line) && line == "last"); // unterminated, still a line
  assert(!read_line(in, line));
  assert(!in.bad());
  std::cout << " Passed\n";
}

void test_line_window() {
  std::cout << "Test: Line window bounds lookback..." << std::flush;
  LineWindow window(2, 3);
  size_t released = 0;
  for (int i = 0; i < 1000; ++i) {
    auto line = window.push("line " + std::to_string(i) + "\n");
    if (line) {
      // First release is the line after the two dropped ones
      if (released == 0)
        assert(*line == "line 2\n");
      ++released;
    }
    assert(window.buffered() <= 3);
  }
  assert(released == 1000 - 2 - 3);
  assert(window.buffered() == 3);

  LineWindow passthrough(0, 0);
  assert(passthrough.push("x\n").value() == "x\n");
  assert(passthrough.buffered() == 0);
  std::cout << " Passed\n";
}

void test_plain_concatenation() {
  std::cout << "Test: Plain concatenation is byte exact..." << std::flush;
  ConcatOptions options;
  assert(concat_strings({"a\nb\n", "c", "\r\nd\n", ""}, options) ==
         "a\nb\nc\r\nd\n");
  assert(concat_strings({"no newline", "next"}, options) ==
         "no newlinenext");
  assert(concat_strings({}, options) == "");
  std::cout << " Passed\n";
}

void test_skip_head() {
  std::cout << "Test: Skip head on every source..." << std::flush;
  ConcatOptions options;
  options.skipHead = 1;
  assert(concat_strings({"h1\na\n", "h2\nb\n", "h3\nc"}, options) ==
         "a\nb\nc");

  options.headOnce = true;
  assert(concat_strings({"h1\na\n", "h2\nb\n", "h3\nc"}, options) ==
         "h1\na\nb\nc");

  // Skip counts beyond the source length are not errors
  options.headOnce = false;
  options.skipHead = 10;
  assert(concat_strings({"a\nb\n", "c\n"}, options) == "");
  std::cout << " Passed\n";
}

void test_skip_tail() {
  std::cout << "Test: Skip tail on every source..." << std::flush;
  ConcatOptions options;
  options.skipTail = 1;
  assert(concat_strings({"a\nb\nf1\n", "c\nf2\n"}, options) == "a\nb\nc\n");
  // Unterminated last line counts as a line
  assert(concat_strings({"a\nb"}, options) == "a\n");

  options.tailOnce = true;
  assert(concat_strings({"a\nf1\n", "b\nf2\n", "c\nf3\n"}, options) ==
         "a\nb\nc\nf3\n");

  // head_once only changes head skipping
  ConcatOptions head_once;
  head_once.skipTail = 1;
  head_once.headOnce = true;
  assert(concat_strings({"a\nb\n", "c\nd\n"}, head_once) == "a\nc\n");

  // head + tail covering the whole source leaves nothing
  ConcatOptions both;
  both.skipHead = 2;
  both.skipTail = 2;
  assert(concat_strings({"1\n2\n3\n", "1\n2\n3\n4\n5\n"}, both) == "3\n");
  std::cout << " Passed\n";
}

void test_header_footer_scenario() {
  std::cout << "Test: Head once with tail skip and newline..." << std::flush;
  ConcatOptions options;
  options.skipHead = 1;
  options.skipTail = 1;
  options.headOnce = true;
  options.newline = true;
  assert(concat_strings({"a\nb\nc\n", "d\ne\nf\n", "g\nh\ni\n"}, options) ==
         "a\nb\ne\nh\n");
  std::cout << " Passed\n";
}

void test_newline_enforcement() {
  std::cout << "Test: Trailing newline enforcement..." << std::flush;
  ConcatOptions options;
  options.newline = true;
  assert(concat_strings({"x"}, options) == "x\n");
  assert(concat_strings({"x\n"}, options) == "x\n");
  // Only the very last byte matters
  assert(concat_strings({"a", "b"}, options) == "ab\n");

  // Empty output stays empty
  assert(concat_strings({}, options) == "");
  assert(concat_strings({"", ""}, options) == "");

  // Padding counts as output
  options.paddingAfter = std::string("end");
  assert(concat_strings({"x\n"}, options) == "x\nend\n");

  ConcatOptions crlf;
  crlf.newline = true;
  crlf.newlineStyle = NewlineStyle::Crlf;
  assert(concat_strings({"x"}, crlf) == "x\r\n");
  assert(concat_strings({"x\n"}, crlf) == "x\n");
  std::cout << " Passed\n";
}

void test_newline_idempotent() {
  std::cout << "Test: Newline enforcement is idempotent..." << std::flush;
  ConcatOptions options;
  options.newline = true;
  std::string first = concat_strings({"a\nb", "c"}, options);
  std::string second = concat_strings({first}, options);
  assert(first == "a\nbc\n");
  assert(second == first);
  std::cout << " Passed\n";
}

void test_padding_placement() {
  std::cout << "Test: Padding placement..." << std::flush;
  ConcatOptions options;
  options.paddingBefore = std::string("[");
  options.paddingBetween = std::string("|");
  options.paddingAfter = std::string("]");
  assert(concat_strings({"a\n", "b\n", "c\n"}, options) == "[a\n|b\n|c\n]");

  // No boundaries without sources
  assert(concat_strings({}, options) == "[]");
  // Empty sources still get their padding
  assert(concat_strings({"", ""}, options) == "[|]");

  // Empty padding is the same as no padding
  ConcatOptions empty;
  empty.paddingBetween = std::string("");
  assert(concat_strings({"a\n", "b\n"}, empty) == "a\nb\n");
  std::cout << " Passed\n";
}

void test_padding_is_verbatim() {
  std::cout << "Test: Padding is not treated as lines..." << std::flush;
  ConcatOptions options;
  options.skipHead = 1;
  options.skipTail = 1;
  options.paddingBetween = std::string("--\n--\n");
  // First source yields nothing, the padding still appears once and whole
  assert(concat_strings({"only\n", "h\nkeep\nt\n"}, options) ==
         "--\n--\nkeep\n");
  std::cout << " Passed\n";
}

void test_sources_opened_one_at_a_time() {
  std::cout << "Test: Sources are opened lazily, one at a time..."
            << std::flush;
  int live = 0;
  int opened = 0;
  std::vector<Source> sources;
  for (int i = 0; i < 3; ++i) {
    sources.push_back(
        Source{"tracked" + std::to_string(i), [&live, &opened, i]() {
                 assert(live == 0); // previous source already closed
                 ++opened;
                 return std::unique_ptr<std::istream>(
                     std::make_unique<TrackedStream>(
                         std::to_string(i) + "\n", live));
               }});
  }
  assert(opened == 0);
  std::atomic<bool> stop{false};
  std::ostringstream out;
  ConcatStats stats = concatenate_sources(sources, ConcatOptions{}, out, stop);
  assert(out.str() == "0\n1\n2\n");
  assert(opened == 3);
  assert(live == 0);
  assert(stats.sourcesProcessed == 3);
  assert(stats.linesRead == 3);
  assert(stats.linesWritten == 3);
  assert(stats.bytesWritten == 6);
  std::cout << " Passed\n";
}

void test_source_open_failure() {
  std::cout << "Test: Missing source aborts with its position..."
            << std::flush;
  cleanup_test_directories();
  create_test_file(TEST_DIR_PATH / "first.txt", "first\n");
  std::vector<Source> sources =
      build_sources({TEST_DIR_PATH / "first.txt", TEST_DIR_PATH / "missing.txt",
                     TEST_DIR_PATH / "first.txt"});

  std::atomic<bool> stop{false};
  std::ostringstream out;
  bool thrown = false;
  try {
    concatenate_sources(sources, ConcatOptions{}, out, stop);
  } catch (const ConcatError &e) {
    thrown = true;
    assert(e.kind() == ErrorKind::SourceOpen);
    assert(e.source_index() == 1);
    assert(e.source_name().find("missing.txt") != std::string::npos);
    assert(std::string(e.what()).find("source 2") != std::string::npos);
  }
  assert(thrown);
  // Output already written is kept
  assert(out.str() == "first\n");

  // A directory is not a readable source
  std::vector<Source> dir_source = build_sources({TEST_DIR_PATH});
  thrown = false;
  try {
    concatenate_sources(dir_source, ConcatOptions{}, out, stop);
  } catch (const ConcatError &e) {
    thrown = true;
    assert(e.kind() == ErrorKind::SourceOpen);
    assert(e.source_index() == 0);
  }
  assert(thrown);
  std::cout << " Passed\n";
}

void test_source_read_failure() {
  std::cout << "Test: Read failure aborts after partial output..."
            << std::flush;
  std::vector<Source> sources = string_sources({"ok\n"});
  sources.push_back(Source{"flaky", []() {
                             return std::unique_ptr<std::istream>(
                                 std::make_unique<FailingStream>("a\nb\n"));
                           }});
  sources.push_back(string_source("never", "unreached\n"));

  std::atomic<bool> stop{false};
  std::ostringstream out;
  ConcatOptions options;
  options.paddingBetween = std::string("|");
  bool thrown = false;
  try {
    concatenate_sources(sources, options, out, stop);
  } catch (const ConcatError &e) {
    thrown = true;
    assert(e.kind() == ErrorKind::SourceRead);
    assert(e.source_index() == 1);
    assert(e.source_name() == "flaky");
  }
  assert(thrown);
  assert(out.str() == "ok\n|a\nb\n");
  std::cout << " Passed\n";
}

void test_sink_write_failure() {
  std::cout << "Test: Sink failure aborts the run..." << std::flush;
  std::ostream broken(nullptr); // no buffer: every write fails
  std::atomic<bool> stop{false};
  bool thrown = false;
  try {
    concatenate_sources(string_sources({"a\n"}), ConcatOptions{}, broken,
                        stop);
  } catch (const ConcatError &e) {
    thrown = true;
    assert(e.kind() == ErrorKind::SinkWrite);
    assert(!e.source_index());
  }
  assert(thrown);
  std::cout << " Passed\n";
}

void test_interrupt() {
  std::cout << "Test: Stop flag interrupts the run..." << std::flush;
  std::atomic<bool> stop{true};
  std::ostringstream out;
  bool thrown = false;
  try {
    concatenate_sources(string_sources({"a\n", "b\n"}), ConcatOptions{}, out,
                        stop);
  } catch (const ConcatError &e) {
    thrown = true;
    assert(e.kind() == ErrorKind::Interrupted);
    assert(e.source_index() == 0);
  }
  assert(thrown);
  assert(out.str().empty());
  std::cout << " Passed\n";
}

void test_file_sources_to_output_file() {
  std::cout << "Test: Files concatenated into an output file..."
            << std::flush;
  cleanup_test_directories();
  create_test_file(TEST_DIR_PATH / "one.csv", "id,name\n1,a\n2,b\n");
  create_test_file(TEST_DIR_PATH / "two.csv", "id,name\n3,c\n4,d");
  fs::path output_file = TEST_DIR_PATH / "nested" / "out" / "merged.csv";

  std::ofstream stream;
  assert(open_output_stream(output_file, stream, false));
  assert(fs::exists(output_file.parent_path())); // parent created

  ConcatOptions options;
  options.skipHead = 1;
  options.headOnce = true;
  options.newline = true;
  std::atomic<bool> stop{false};
  concatenate_sources(
      build_sources({TEST_DIR_PATH / "one.csv", TEST_DIR_PATH / "two.csv"}),
      options, stream, stop);
  stream.close();
  assert(read_file(output_file) == "id,name\n1,a\n2,b\n3,c\n4,d\n");

  // Re-opening truncates
  std::ofstream again;
  assert(open_output_stream(output_file, again, false));
  again.close();
  assert(read_file(output_file).empty());

  // An existing directory is rejected
  std::ofstream dir_stream;
  assert(!open_output_stream(TEST_DIR_PATH, dir_stream, false));
  std::cout << " Passed\n";
}

void test_stdin_source() {
  std::cout << "Test: '-' reads standard input..." << std::flush;
  std::istringstream fake_stdin("from stdin\n");
  std::streambuf *old_cin = std::cin.rdbuf(fake_stdin.rdbuf());

  Source source = make_file_source("-");
  assert(source.name == "<stdin>");
  std::atomic<bool> stop{false};
  std::ostringstream out;
  concatenate_sources({string_source("mem", "x\n"), source}, ConcatOptions{},
                      out, stop);
  std::cin.rdbuf(old_cin);
  assert(out.str() == "x\nfrom stdin\n");
  std::cout << " Passed\n";
}

void test_read_paths_from_stream() {
  std::cout << "Test: Path list from stdin..." << std::flush;
  std::istringstream in("a.txt b.txt\nc.txt\r\n   d.txt  \n\n\tsub/e.txt");
  std::vector<fs::path> paths = read_paths_from_stream(in);
  assert(paths.size() == 5);
  assert(paths[0] == "a.txt");
  assert(paths[1] == "b.txt");
  assert(paths[2] == "c.txt");
  assert(paths[3] == "d.txt");
  assert(paths[4] == "sub/e.txt");

  std::istringstream empty("  \n \n");
  assert(read_paths_from_stream(empty).empty());
  std::cout << " Passed\n";
}

void test_parse_count() {
  std::cout << "Test: Parse count..." << std::flush;
  assert(parse_count("0", "-s") == 0);
  assert(parse_count("42", "-s") == 42);
  auto rejects = [](std::string_view value) {
    try {
      parse_count(value, "-s");
    } catch (const std::invalid_argument &) {
      return true;
    }
    return false;
  };
  assert(rejects(""));
  assert(rejects("-1"));
  assert(rejects("3x"));
  assert(rejects("99999999999999999999999999"));
  std::cout << " Passed\n";
}

void test_resolve_skip() {
  std::cout << "Test: Resolve skip options..." << std::flush;
  SkipFlags none;
  assert(resolve_skip(none, "head") == std::make_pair(size_t{0}, false));

  SkipFlags each;
  each.each = 3;
  assert(resolve_skip(each, "head") == std::make_pair(size_t{3}, false));

  SkipFlags once;
  once.once = 2;
  assert(resolve_skip(once, "head") == std::make_pair(size_t{2}, true));

  SkipFlags flag;
  flag.onceFlag = true;
  assert(resolve_skip(flag, "head") == std::make_pair(size_t{1}, true));

  SkipFlags conflict;
  conflict.each = 1;
  conflict.onceFlag = true;
  bool thrown = false;
  try {
    resolve_skip(conflict, "-s and -H");
  } catch (const std::invalid_argument &e) {
    thrown = true;
    assert(std::string(e.what()).find("-s and -H") != std::string::npos);
  }
  assert(thrown);
  std::cout << " Passed\n";
}

void test_apply_pad_mode() {
  std::cout << "Test: Pad modes..." << std::flush;
  ConcatOptions between;
  apply_pad_mode(between, parse_pad_mode("between"), "--");
  assert(!between.paddingBefore && between.paddingBetween == "--" &&
         !between.paddingAfter);

  ConcatOptions all;
  apply_pad_mode(all, parse_pad_mode("all"), "#");
  assert(all.paddingBefore == "#" && all.paddingBetween == "#" &&
         all.paddingAfter == "#");

  ConcatOptions before;
  apply_pad_mode(before, parse_pad_mode("beforestart"), "B");
  assert(before.paddingBefore == "B" && !before.paddingBetween);

  ConcatOptions after;
  apply_pad_mode(after, parse_pad_mode("afterend"), "A");
  assert(after.paddingAfter == "A" && !after.paddingBetween);

  bool thrown = false;
  try {
    parse_pad_mode("sideways");
  } catch (const std::invalid_argument &) {
    thrown = true;
  }
  assert(thrown);
  std::cout << " Passed\n";
}

void test_parse_arguments() {
  std::cout << "Test: Parse arguments..." << std::flush;
  char *argv[] = {(char *)"linecat",  (char *)"-H",      (char *)"-e",
                  (char *)"2",        (char *)"-p",      (char *)"---\n",
                  (char *)"-n",       (char *)"-N",      (char *)"crlf",
                  (char *)"a.csv",    (char *)"b.csv",   (char *)"-v"};
  int argc = sizeof(argv) / sizeof(argv[0]);
  Config config = parse_arguments(argc, argv);
  assert(!config.readPathsFromStdin);
  assert(config.inputPaths.size() == 2);
  assert(config.inputPaths[0] == "a.csv" && config.inputPaths[1] == "b.csv");
  assert(config.options.skipHead == 1 && config.options.headOnce);
  assert(config.options.skipTail == 2 && !config.options.tailOnce);
  assert(config.options.paddingBetween == "---\n");
  assert(!config.options.paddingBefore && !config.options.paddingAfter);
  assert(config.options.newline);
  assert(config.options.newlineStyle == NewlineStyle::Crlf);
  assert(config.verbose && !config.dryRun);
  assert(config.outputFile.empty());

  char *argv_input[] = {(char *)"linecat", (char *)"-i",  (char *)"x.txt",
                        (char *)"-",       (char *)"y.txt", (char *)"-o",
                        (char *)"out.txt", (char *)"-E",  (char *)"3",
                        (char *)"-P",      (char *)"all", (char *)"-p",
                        (char *)"#",       (char *)"--pad-after",
                        (char *)"END",     (char *)"-D"};
  int argc_input = sizeof(argv_input) / sizeof(argv_input[0]);
  Config config_input = parse_arguments(argc_input, argv_input);
  assert(config_input.inputPaths.size() == 3);
  assert(config_input.inputPaths[1] == "-");
  assert(config_input.outputFile == "out.txt");
  assert(config_input.options.skipTail == 3 && config_input.options.tailOnce);
  assert(config_input.options.skipHead == 0);
  assert(config_input.options.paddingBefore == "#");
  assert(config_input.options.paddingBetween == "#");
  assert(config_input.options.paddingAfter == "END"); // explicit wins
  assert(config_input.dryRun);

  // No paths: the list comes from stdin
  char *argv_bare[] = {(char *)"linecat", (char *)"-s", (char *)"1"};
  Config config_bare = parse_arguments(3, argv_bare);
  assert(config_bare.readPathsFromStdin);
  assert(config_bare.inputPaths.empty());
  assert(config_bare.options.skipHead == 1 && !config_bare.options.headOnce);
  assert(!config_bare.options.newline);
  std::cout << " Passed\n";
}

void test_parse_options_rejects() {
  std::cout << "Test: Parse options rejects bad command lines..."
            << std::flush;
  auto rejects = [](std::vector<std::string> args) {
    std::vector<char *> argv;
    for (auto &arg : args)
      argv.push_back(arg.data());
    try {
      parse_options(static_cast<int>(argv.size()), argv.data());
    } catch (const std::invalid_argument &) {
      return true;
    }
    return false;
  };
  // -i must be followed by at least one path
  assert(rejects({"linecat", "-i", "-n"}));
  assert(rejects({"linecat", "--input"}));
  assert(rejects({"linecat", "-s", "1", "-H"}));
  assert(rejects({"linecat", "-e", "1", "-E", "2"}));
  assert(rejects({"linecat", "-P", "sideways"}));
  assert(rejects({"linecat", "-N", "cr"}));
  assert(rejects({"linecat", "-o"}));
  assert(rejects({"linecat", "--bogus"}));

  bool usage = false;
  try {
    std::string prog = "linecat", bogus = "--bogus";
    char *argv[] = {prog.data(), bogus.data()};
    parse_options(2, argv);
  } catch (const UsageError &) {
    usage = true;
  }
  assert(usage);

  // A pad mode alone is accepted and places nothing
  std::string prog = "linecat", flag = "-P", mode = "between";
  char *argv[] = {prog.data(), flag.data(), mode.data()};
  Config config = parse_options(3, argv);
  assert(!config.options.paddingBefore && !config.options.paddingBetween &&
         !config.options.paddingAfter);
  std::cout << " Passed\n";
}

void test_escape_for_display() {
  std::cout << "Test: Escape for display..." << std::flush;
  assert(escape_for_display("a\nb\t\r") == "a\\nb\\t\\r");
  assert(escape_for_display("\x1b[0m") == "\\x1b[0m");
  assert(escape_for_display(std::string("\0\x7f", 2)) == "\\x00\\x7f");
  assert(escape_for_display("plain \"q\"") == "plain \\\"q\\\"");
  std::cout << " Passed\n";
}

void test_dry_run() {
  std::cout << "Test: Dry run listing..." << std::flush;
  Config config;
  config.options.skipHead = 1;
  config.options.headOnce = true;
  config.options.paddingBetween = std::string("--\n");
  config.outputFile = "merged.txt";

  int opened = 0;
  std::vector<Source> sources = {
      Source{"first.txt",
             [&opened]() {
               ++opened;
               return std::unique_ptr<std::istream>(
                   std::make_unique<std::istringstream>(""));
             }},
      Source{"second.txt", [&opened]() {
               ++opened;
               return std::unique_ptr<std::istream>(
                   std::make_unique<std::istringstream>(""));
             }}};

  std::ostringstream out;
  print_dry_run(config, sources, out);
  std::string listing = out.str();
  assert(opened == 0); // nothing is read
  assert(listing.find("(2 total)") != std::string::npos);
  assert(listing.find("1: first.txt") != std::string::npos);
  assert(listing.find("2: second.txt") != std::string::npos);
  assert(listing.find("(first source kept)") != std::string::npos);
  assert(listing.find("\"--\\n\"") != std::string::npos);
  assert(listing.find("merged.txt") != std::string::npos);
  std::cout << " Passed\n";
}

int main() {
  try {
    test_trim();
    test_read_line();
    test_line_window();
    test_plain_concatenation();
    test_skip_head();
    test_skip_tail();
    test_header_footer_scenario();
    test_newline_enforcement();
    test_newline_idempotent();
    test_padding_placement();
    test_padding_is_verbatim();
    test_sources_opened_one_at_a_time();
    test_source_open_failure();          // Uses TEST_DIR_PATH
    test_source_read_failure();
    test_sink_write_failure();
    test_interrupt();
    test_file_sources_to_output_file();  // Uses TEST_DIR_PATH
    test_stdin_source();
    test_read_paths_from_stream();
    test_parse_count();
    test_resolve_skip();
    test_apply_pad_mode();
    test_parse_arguments();
    test_parse_options_rejects();
    test_escape_for_display();
    test_dry_run();

    cleanup_test_directories();
    std::cout << "\nAll tests passed successfully!\n";
    return 0;

  } catch (const std::exception &e) {
    std::cerr << "\n\n!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!\n";
    std::cerr << "Test failed with exception: " << e.what() << std::endl;
    std::cerr << "!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!\n\n";
    cleanup_test_directories(); // Attempt cleanup even on failure
    return 1;
  }
}
