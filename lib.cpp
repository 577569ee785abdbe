#include <algorithm>
#include <atomic>
#include <cctype> // For std::isdigit
#include <cerrno>
#include <cstdlib> // For std::exit
#include <cstring> // For std::strerror
#include <deque>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error> // For filesystem errors
#include <utility>      // For std::move, std::pair
#include <vector>

namespace fs = std::filesystem;

// --- Configuration ---

enum class NewlineStyle { Lf, Crlf };

// Options for the concatenation engine. Resolved once by parse_arguments and
// read-only for the whole run.
struct ConcatOptions {
  size_t skipHead = 0;   // Leading lines dropped from each source
  size_t skipTail = 0;   // Trailing lines dropped from each source
  bool headOnce = false; // First source keeps its head lines
  bool tailOnce = false; // Last source keeps its tail lines
  bool newline = false;  // Output must end with a newline
  NewlineStyle newlineStyle = NewlineStyle::Lf;
  std::optional<std::string> paddingBefore;
  std::optional<std::string> paddingBetween;
  std::optional<std::string> paddingAfter;
};

struct Config {
  std::vector<fs::path> inputPaths; // In command line order, "-" is stdin
  bool readPathsFromStdin = true;   // No paths given: read the list from stdin
  fs::path outputFile;              // Empty means stdout
  bool dryRun = false;
  bool verbose = false;
  ConcatOptions options;
};

// --- Utility Functions ---

std::string trim(std::string_view str) {
  constexpr std::string_view whitespace = " \t\n\r\f\v";
  size_t start = str.find_first_not_of(whitespace);
  if (start == std::string_view::npos)
    return "";
  size_t end = str.find_last_not_of(whitespace);
  return std::string(str.substr(start, end - start + 1));
}

// Normalizes path separators to '/' and simplifies lexically
std::string normalize_path(const fs::path &path) {
  std::string path_str = path.lexically_normal().string();
  std::replace(path_str.begin(), path_str.end(), '\\', '/');
  return path_str;
}

std::string_view newline_sequence(NewlineStyle style) {
  return style == NewlineStyle::Crlf ? "\r\n" : "\n";
}

// Makes control characters visible, for dry run listings
std::string escape_for_display(std::string_view bytes) {
  std::string escaped;
  escaped.reserve(bytes.size() + 2);
  for (char c : bytes) {
    switch (c) {
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '"':
      escaped += "\\\"";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f) {
        static constexpr char hex[] = "0123456789abcdef";
        unsigned char byte = static_cast<unsigned char>(c);
        escaped += "\\x";
        escaped += hex[byte >> 4];
        escaped += hex[byte & 0x0f];
      } else {
        escaped += c;
      }
    }
  }
  return escaped;
}

// --- Errors ---

enum class ErrorKind { SourceOpen, SourceRead, SinkWrite, Interrupted };

const char *error_kind_name(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::SourceOpen:
    return "source open failure";
  case ErrorKind::SourceRead:
    return "source read failure";
  case ErrorKind::SinkWrite:
    return "output write failure";
  case ErrorKind::Interrupted:
    return "interrupted";
  }
  return "unknown error";
}

// Raised by the engine. Carries the zero-based position of the failing source
// for open/read/interrupt failures; sink failures have no position.
class ConcatError : public std::runtime_error {
public:
  ConcatError(ErrorKind kind, std::optional<size_t> source_index,
              std::string source_name, const std::string &detail)
      : std::runtime_error(
            format_message(kind, source_index, source_name, detail)),
        kind_(kind), source_index_(source_index),
        source_name_(std::move(source_name)) {}

  ErrorKind kind() const { return kind_; }
  std::optional<size_t> source_index() const { return source_index_; }
  const std::string &source_name() const { return source_name_; }

private:
  static std::string format_message(ErrorKind kind,
                                    std::optional<size_t> source_index,
                                    const std::string &source_name,
                                    const std::string &detail) {
    std::ostringstream message;
    message << error_kind_name(kind);
    if (source_index) {
      // Positions are shown 1-based
      message << " on source " << (*source_index + 1) << " ("
              << source_name << ")";
    }
    if (!detail.empty()) {
      message << ": " << detail;
    }
    return message.str();
  }

  ErrorKind kind_;
  std::optional<size_t> source_index_;
  std::string source_name_;
};

// --- Sources ---

// A source is opened only when the engine reaches it, so at most one stream
// is alive at a time. `open` may throw; the engine reports it as SourceOpen.
struct Source {
  std::string name;
  std::function<std::unique_ptr<std::istream>()> open;
};

Source make_stdin_source() {
  return Source{"<stdin>", []() {
                  // Shares std::cin's buffer without taking ownership of it
                  return std::make_unique<std::istream>(std::cin.rdbuf());
                }};
}

Source make_file_source(const fs::path &path) {
  if (path == "-") {
    return make_stdin_source();
  }
  return Source{normalize_path(path), [path]() {
                  std::error_code ec;
                  if (fs::is_directory(path, ec)) {
                    throw std::system_error(
                        std::make_error_code(std::errc::is_a_directory));
                  }
                  errno = 0;
                  auto file = std::make_unique<std::ifstream>(
                      path, std::ios::binary | std::ios::in);
                  if (!file->is_open()) {
                    int err = errno != 0 ? errno : ENOENT;
                    throw std::system_error(err, std::generic_category());
                  }
                  return std::unique_ptr<std::istream>(std::move(file));
                }};
}

std::vector<Source> build_sources(const std::vector<fs::path> &paths) {
  std::vector<Source> sources;
  sources.reserve(paths.size());
  for (const auto &path : paths) {
    sources.push_back(make_file_source(path));
  }
  return sources;
}

// Reads a whitespace separated path list, as piped in by `find` or `ls`.
// Spaces and newlines separate entries; empty entries are dropped.
std::vector<fs::path> read_paths_from_stream(std::istream &in) {
  std::string content((std::istreambuf_iterator<char>(in)),
                      std::istreambuf_iterator<char>());
  std::vector<fs::path> paths;
  std::string_view view = content;
  size_t start = 0;
  while (start < view.size()) {
    size_t end = view.find_first_of(" \n", start);
    if (end == std::string_view::npos)
      end = view.size();
    std::string entry = trim(view.substr(start, end - start));
    if (!entry.empty()) {
      paths.emplace_back(std::move(entry));
    }
    start = end + 1;
  }
  return paths;
}

// --- Concatenation Engine ---

struct ConcatStats {
  size_t sourcesProcessed = 0;
  size_t linesRead = 0;
  size_t linesWritten = 0;
  unsigned long long bytesWritten = 0;
};

// Reads one line including its '\n'. A final line without a terminator is
// returned as it is. Returns false at end of stream or on a stream error.
bool read_line(std::istream &in, std::string &line) {
  line.clear();
  if (!std::getline(in, line)) {
    return false;
  }
  // getline only sets eofbit when it ran out of input before a '\n'
  if (!in.eof()) {
    line.push_back('\n');
  }
  return true;
}

// Drops the first `skip_head` lines it is given and holds back the most
// recent `skip_tail` lines, releasing a line once it can no longer be part of
// the tail. Never buffers more than `skip_tail` lines.
class LineWindow {
public:
  LineWindow(size_t skip_head, size_t skip_tail)
      : skip_head_(skip_head), skip_tail_(skip_tail) {}

  std::optional<std::string> push(std::string line) {
    if (head_dropped_ < skip_head_) {
      ++head_dropped_;
      return std::nullopt;
    }
    if (skip_tail_ == 0) {
      return line;
    }
    window_.push_back(std::move(line));
    if (window_.size() <= skip_tail_) {
      return std::nullopt;
    }
    std::string released = std::move(window_.front());
    window_.pop_front();
    return released;
  }

  size_t buffered() const { return window_.size(); }

private:
  size_t skip_head_;
  size_t skip_tail_;
  size_t head_dropped_ = 0;
  std::deque<std::string> window_;
};

// Writes through to the output stream and remembers the last byte, which is
// all the trailing newline check needs.
class SinkWriter {
public:
  explicit SinkWriter(std::ostream &out) : out_(out) {}

  void write(std::string_view bytes) {
    if (bytes.empty())
      return;
    out_.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!out_) {
      throw ConcatError(ErrorKind::SinkWrite, std::nullopt, "",
                        "could not write to output stream");
    }
    last_byte_ = bytes.back();
    bytes_written_ += bytes.size();
  }

  void flush() {
    out_.flush();
    if (!out_) {
      throw ConcatError(ErrorKind::SinkWrite, std::nullopt, "",
                        "could not flush output stream");
    }
  }

  bool empty() const { return bytes_written_ == 0; }
  bool ends_with_newline() const { return !empty() && last_byte_ == '\n'; }
  unsigned long long bytes_written() const { return bytes_written_; }

private:
  std::ostream &out_;
  char last_byte_ = '\0';
  unsigned long long bytes_written_ = 0;
};

void write_padding(SinkWriter &sink,
                   const std::optional<std::string> &padding) {
  if (padding) {
    sink.write(*padding);
  }
}

// Concatenates `sources` into `output` in order:
//   before? source[0] between? source[1] ... source[n-1] after? newline?
// Each source loses its first skipHead lines (except the first source when
// headOnce) and its last skipTail lines (except the last source when
// tailOnce). Output already written stays written when a ConcatError is
// thrown. With `newline` set and nothing written, nothing is appended.
ConcatStats concatenate_sources(const std::vector<Source> &sources,
                                const ConcatOptions &options,
                                std::ostream &output,
                                const std::atomic<bool> &should_stop) {
  SinkWriter sink(output);
  ConcatStats stats;

  write_padding(sink, options.paddingBefore);

  std::string line;
  for (size_t index = 0; index < sources.size(); ++index) {
    const Source &source = sources[index];
    if (should_stop) {
      throw ConcatError(ErrorKind::Interrupted, index, source.name,
                        "stopped before opening");
    }
    if (index > 0) {
      write_padding(sink, options.paddingBetween);
    }

    const bool is_first = (index == 0);
    const bool is_last = (index + 1 == sources.size());
    const size_t skip_head =
        (options.headOnce && is_first) ? 0 : options.skipHead;
    const size_t skip_tail =
        (options.tailOnce && is_last) ? 0 : options.skipTail;

    std::unique_ptr<std::istream> stream;
    try {
      stream = source.open();
    } catch (const std::exception &e) {
      throw ConcatError(ErrorKind::SourceOpen, index, source.name, e.what());
    }
    if (!stream || !*stream) {
      throw ConcatError(ErrorKind::SourceOpen, index, source.name,
                        "stream is not readable");
    }

    LineWindow window(skip_head, skip_tail);
    while (read_line(*stream, line)) {
      if (should_stop) {
        throw ConcatError(ErrorKind::Interrupted, index, source.name,
                          "stopped while reading");
      }
      ++stats.linesRead;
      if (auto released = window.push(std::move(line))) {
        sink.write(*released);
        ++stats.linesWritten;
      }
    }
    if (stream->bad()) {
      throw ConcatError(ErrorKind::SourceRead, index, source.name,
                        "read error");
    }
    // Lines still in the window are the tail; they are dropped with it.
    ++stats.sourcesProcessed;
  }

  write_padding(sink, options.paddingAfter);

  if (options.newline && !sink.empty() && !sink.ends_with_newline()) {
    sink.write(newline_sequence(options.newlineStyle));
  }

  sink.flush();
  stats.bytesWritten = sink.bytes_written();
  return stats;
}

// --- Output ---

// Opens `output_file` for writing (binary, truncate), creating its parent
// directory if needed. Reports problems on std::cerr.
bool open_output_stream(const fs::path &output_file, std::ofstream &stream,
                        bool verbose) {
  fs::path absOutputPath = fs::absolute(output_file);
  fs::path parentPath = absOutputPath.parent_path();

  if (!parentPath.empty() && !fs::exists(parentPath)) {
    try {
      fs::create_directories(parentPath);
      if (verbose) {
        std::cerr << "Info: Created output directory: "
                  << normalize_path(parentPath) << '\n';
      }
    } catch (const std::exception &e) {
      std::cerr << "ERROR: Failed to create output directory "
                << normalize_path(parentPath) << ": " << e.what() << '\n';
      return false;
    }
  }

  if (fs::exists(absOutputPath) && fs::is_directory(absOutputPath)) {
    std::cerr << "ERROR: Output path is an existing directory: "
              << normalize_path(absOutputPath) << '\n';
    return false;
  }

  stream.open(absOutputPath,
              std::ios::binary | std::ios::out | std::ios::trunc);
  if (!stream.is_open()) {
    std::cerr << "ERROR: Could not open output file for writing: "
              << normalize_path(absOutputPath) << ": " << std::strerror(errno)
              << '\n';
    return false;
  }
  return true;
}

// --- Reporting ---

void print_dry_run(const Config &config, const std::vector<Source> &sources,
                   std::ostream &out) {
  const ConcatOptions &options = config.options;
  out << "Sources to be concatenated (" << sources.size() << " total):\n";
  for (size_t i = 0; i < sources.size(); ++i) {
    out << "  " << (i + 1) << ": " << sources[i].name << "\n";
  }

  auto describe_padding = [](const std::optional<std::string> &padding) {
    return padding ? "\"" + escape_for_display(*padding) + "\""
                   : std::string("none");
  };

  out << "Options:\n";
  std::vector<std::pair<std::string, std::string>> rows = {
      {"skip head", std::to_string(options.skipHead) +
                        (options.headOnce ? " (first source kept)" : "")},
      {"skip tail", std::to_string(options.skipTail) +
                        (options.tailOnce ? " (last source kept)" : "")},
      {"newline",
       options.newline ? (options.newlineStyle == NewlineStyle::Crlf ? "crlf"
                                                                     : "lf")
                       : "off"},
      {"padding before", describe_padding(options.paddingBefore)},
      {"padding between", describe_padding(options.paddingBetween)},
      {"padding after", describe_padding(options.paddingAfter)},
      {"output", config.outputFile.empty()
                     ? std::string("stdout")
                     : normalize_path(config.outputFile)}};

  size_t width = 0;
  for (const auto &row : rows) {
    width = std::max(width, row.first.length());
  }
  for (const auto &row : rows) {
    out << "  " << std::left << std::setw(width + 2) << row.first
        << row.second << "\n";
  }
}

void print_summary(const ConcatStats &stats, const Config &config) {
  std::stringstream ss_msg;
  ss_msg << "Processed " << stats.sourcesProcessed << " sources ("
         << stats.linesWritten << " of " << stats.linesRead
         << " lines written, " << std::fixed << std::setprecision(2)
         << (stats.bytesWritten / (1024.0 * 1024.0)) << " MiB total).\n";
  if (config.outputFile.empty()) {
    ss_msg << "Output sent to stdout.\n";
  } else {
    ss_msg << "Output written to: "
           << normalize_path(fs::absolute(config.outputFile)) << '\n';
  }
  // stderr keeps the report out of the concatenated stream
  std::cerr << ss_msg.str();
}

// --- Signal Handling ---

std::atomic<bool> *globalShouldStop = nullptr;
void signalHandler(int signum) {
  if (globalShouldStop && !globalShouldStop->load()) {
    std::cerr << "\nInterrupt signal (" << signum
              << ") received, stopping gracefully...\n";
    *globalShouldStop = true;
  } else {
    std::cerr << "\nInterrupt signal (" << signum
              << ") received again, forcing exit.\n";
    std::exit(128 + signum); // Standard exit code for signals
  }
}

// --- Argument Parsing ---

// Parses a non-negative line count. Throws std::invalid_argument.
size_t parse_count(std::string_view value, std::string_view option) {
  std::string text = trim(value);
  if (text.empty() ||
      !std::all_of(text.begin(), text.end(),
                   [](unsigned char c) { return std::isdigit(c); })) {
    throw std::invalid_argument("Invalid value for " + std::string(option) +
                                ": '" + std::string(value) +
                                "'. Expected a non-negative integer.");
  }
  try {
    return static_cast<size_t>(std::stoull(text));
  } catch (const std::out_of_range &) {
    throw std::invalid_argument("Value for " + std::string(option) +
                                " is too large: '" + std::string(value) + "'");
  }
}

// One side (head or tail) of the skip options as given on the command line.
struct SkipFlags {
  std::optional<size_t> each; // -s / -e
  std::optional<size_t> once; // -S / -E
  bool onceFlag = false;      // -H / -T, shorthand for a once-skip of 1
};

// Resolves a side into {count, once}. The three spellings are mutually
// exclusive; `names` lists them for the error message.
std::pair<size_t, bool> resolve_skip(const SkipFlags &flags,
                                     const std::string &names) {
  int given = (flags.each ? 1 : 0) + (flags.once ? 1 : 0) +
              (flags.onceFlag ? 1 : 0);
  if (given > 1) {
    throw std::invalid_argument("Options " + names +
                                " cannot be used together.");
  }
  if (flags.each)
    return {*flags.each, false};
  if (flags.once)
    return {*flags.once, true};
  if (flags.onceFlag)
    return {1, true};
  return {0, false};
}

enum class PadMode { Between, BeforeStart, AfterEnd, All };

PadMode parse_pad_mode(std::string_view value) {
  if (value == "between")
    return PadMode::Between;
  if (value == "beforestart")
    return PadMode::BeforeStart;
  if (value == "afterend")
    return PadMode::AfterEnd;
  if (value == "all")
    return PadMode::All;
  throw std::invalid_argument(
      "Invalid pad mode: '" + std::string(value) +
      "'. Use beforestart, afterend, between or all.");
}

// Places `padding` according to a --pad-mode value.
void apply_pad_mode(ConcatOptions &options, PadMode mode,
                    const std::string &padding) {
  switch (mode) {
  case PadMode::Between:
    options.paddingBetween = padding;
    break;
  case PadMode::BeforeStart:
    options.paddingBefore = padding;
    break;
  case PadMode::AfterEnd:
    options.paddingAfter = padding;
    break;
  case PadMode::All:
    options.paddingBefore = padding;
    options.paddingBetween = padding;
    options.paddingAfter = padding;
    break;
  }
}

NewlineStyle parse_newline_style(std::string_view value) {
  if (value == "lf")
    return NewlineStyle::Lf;
  if (value == "crlf")
    return NewlineStyle::Crlf;
  throw std::invalid_argument("Invalid newline style: '" + std::string(value) +
                              "'. Use lf or crlf.");
}

// Raised for options that are not recognised; the caller shows usage.
class UsageError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

// Builds a Config from the command line. Throws std::invalid_argument (or
// UsageError) on bad or conflicting options; never prints or exits.
Config parse_options(int argc, char *argv[]) {
  Config config;
  SkipFlags head;
  SkipFlags tail;
  std::optional<std::string> padding;
  std::optional<std::string> padMode;
  std::optional<std::string> padBefore;
  std::optional<std::string> padBetween;
  std::optional<std::string> padAfter;

  // Operands may be "-" (stdin) even though they start with '-'
  auto is_operand = [](std::string_view arg) {
    return arg == "-" || arg.empty() || arg[0] != '-';
  };

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    auto take_value = [&]() -> std::string_view {
      if (i + 1 >= argc) {
        throw std::invalid_argument("Missing value for option " +
                                    std::string(arg));
      }
      return argv[++i];
    };

    if (arg == "-i" || arg == "--input") {
      size_t given = 0;
      while (i + 1 < argc && is_operand(argv[i + 1])) {
        config.inputPaths.emplace_back(argv[++i]);
        ++given;
      }
      if (given == 0) {
        throw std::invalid_argument("Missing value for option " +
                                    std::string(arg));
      }
      config.readPathsFromStdin = false;
    } else if (arg == "-o" || arg == "--output") {
      config.outputFile = std::string(take_value());
    } else if (arg == "-s" || arg == "--skip-head") {
      head.each = parse_count(take_value(), arg);
    } else if (arg == "-e" || arg == "--skip-tail") {
      tail.each = parse_count(take_value(), arg);
    } else if (arg == "-S" || arg == "--skip-head-once") {
      head.once = parse_count(take_value(), arg);
    } else if (arg == "-E" || arg == "--skip-tail-once") {
      tail.once = parse_count(take_value(), arg);
    } else if (arg == "-H" || arg == "--headonce") {
      head.onceFlag = true;
    } else if (arg == "-T" || arg == "--tailonce") {
      tail.onceFlag = true;
    } else if (arg == "-p" || arg == "--padding") {
      padding = std::string(take_value());
    } else if (arg == "-P" || arg == "--pad-mode") {
      padMode = std::string(take_value());
    } else if (arg == "--pad-before") {
      padBefore = std::string(take_value());
    } else if (arg == "--pad-between") {
      padBetween = std::string(take_value());
    } else if (arg == "--pad-after") {
      padAfter = std::string(take_value());
    } else if (arg == "-n" || arg == "--newline") {
      config.options.newline = true;
    } else if (arg == "-N" || arg == "--newline-style") {
      config.options.newlineStyle = parse_newline_style(take_value());
    } else if (arg == "-D" || arg == "--dry-run") {
      config.dryRun = true;
    } else if (arg == "-v" || arg == "--verbose") {
      config.verbose = true;
    } else if (is_operand(arg)) {
      config.inputPaths.emplace_back(argv[i]);
      config.readPathsFromStdin = false;
    } else {
      throw UsageError("Unknown or invalid option: " + std::string(arg));
    }
  }

  auto [skipHead, headOnce] =
      resolve_skip(head, "-s/--skip-head, -S/--skip-head-once and "
                         "-H/--headonce");
  auto [skipTail, tailOnce] =
      resolve_skip(tail, "-e/--skip-tail, -E/--skip-tail-once and "
                         "-T/--tailonce");
  config.options.skipHead = skipHead;
  config.options.headOnce = headOnce;
  config.options.skipTail = skipTail;
  config.options.tailOnce = tailOnce;

  // A mode without --padding is still validated, it just places nothing
  PadMode mode = padMode ? parse_pad_mode(*padMode) : PadMode::Between;
  if (padding) {
    apply_pad_mode(config.options, mode, *padding);
  }
  // Explicit positions win over --padding
  if (padBefore)
    config.options.paddingBefore = padBefore;
  if (padBetween)
    config.options.paddingBetween = padBetween;
  if (padAfter)
    config.options.paddingAfter = padAfter;

  return config;
}

Config parse_arguments(int argc, char *argv[]) {
  auto print_usage = [&]() {
    std::cerr << "Usage: " << argv[0] << " [options] [path...]\n";
    std::cerr << "Concatenates files line by line, with optional head/tail "
                 "skipping, padding and a trailing newline.\n"
                 "Without paths, whitespace separated paths are read from "
                 "stdin. A path of '-' reads stdin as content.\n\n";
    std::cerr << "Options:\n";

    std::vector<std::pair<std::string, std::string>> options = {
        {"-i, --input <path...>", "Input paths, in order (same as "
                                  "positional paths)."},
        {"-o, --output <file>", "Write output to <file> instead of stdout."},
        {"-s, --skip-head <n>", "Drop the first <n> lines of every file."},
        {"-e, --skip-tail <n>", "Drop the last <n> lines of every file."},
        {"-S, --skip-head-once <n>",
         "Drop the first <n> lines of every file except the first."},
        {"-E, --skip-tail-once <n>",
         "Drop the last <n> lines of every file except the last."},
        {"-H, --headonce", "Keep only the first file's header line "
                           "(same as -S 1)."},
        {"-T, --tailonce", "Keep only the last file's footer line "
                           "(same as -E 1)."},
        {"-p, --padding <str>", "Padding inserted according to --pad-mode."},
        {"-P, --pad-mode <mode>",
         "Where --padding goes: between (default), beforestart, afterend, "
         "all."},
        {"--pad-before <str>", "Padding before the first file."},
        {"--pad-between <str>", "Padding between adjacent files."},
        {"--pad-after <str>", "Padding after the last file."},
        {"-n, --newline",
         "Make sure the output ends with a newline (nothing for empty "
         "output)."},
        {"-N, --newline-style <lf|crlf>",
         "Newline appended by --newline. Default: lf."},
        {"-D, --dry-run",
         "List sources and resolved options without reading them."},
        {"-v, --verbose", "Print a summary to stderr when done."},
        {"-h, --help", "Show this help message."}};

    size_t max_option_length = 0;
    for (const auto &option : options) {
      max_option_length = std::max(max_option_length, option.first.length());
    }
    for (const auto &option : options) {
      std::cerr << "  " << std::left << std::setw(max_option_length + 2)
                << option.first << option.second << "\n";
    }
  };

  for (int i = 1; i < argc; ++i) {
    if (std::string_view(argv[i]) == "-h" ||
        std::string_view(argv[i]) == "--help") {
      print_usage();
      std::exit(0);
    }
  }

  try {
    return parse_options(argc, argv);
  } catch (const UsageError &e) {
    std::cerr << "ERROR: " << e.what() << "\n\n";
    print_usage();
    std::exit(1);
  } catch (const std::invalid_argument &e) {
    std::cerr << "ERROR: " << e.what() << "\n";
    std::exit(1);
  }
}
