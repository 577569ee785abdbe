#include "./lib.cpp" // Include all definitions from lib.cpp

// Standard Headers needed by main itself
#include <atomic>   // For shouldStop
#include <csignal>  // For signal handling
#include <fstream>  // For std::ofstream
#include <iostream> // For std::cout, std::cerr

int main(int argc, char *argv[]) {
  // 1. Parse Arguments
  Config config = parse_arguments(argc, argv);

  // 2. Setup Signal Handling
  std::atomic<bool> shouldStop{false};
  globalShouldStop = &shouldStop;     // globalShouldStop is defined in lib.cpp
  std::signal(SIGINT, signalHandler); // signalHandler is defined in lib.cpp

  // 3. Resolve Sources (explicit paths win, otherwise a list on stdin)
  std::vector<fs::path> paths = config.inputPaths;
  if (config.readPathsFromStdin) {
    paths = read_paths_from_stream(std::cin);
  }
  std::vector<Source> sources = build_sources(paths);

  if (config.dryRun) {
    print_dry_run(config, sources, std::cout);
    return 0;
  }

  // 4. Setup Output Stream
  std::ofstream outputFileStream;
  std::ostream *outputPtr = &std::cout; // Default to stdout
  if (!config.outputFile.empty()) {
    if (!open_output_stream(config.outputFile, outputFileStream,
                            config.verbose)) {
      return 1;
    }
    outputPtr = &outputFileStream;
  }
  std::ostream &output_stream = *outputPtr;

  // 5. Concatenate
  ConcatStats stats;
  try {
    stats = concatenate_sources(sources, config.options, output_stream,
                                shouldStop);
  } catch (const std::exception &e) {
    // ConcatError already names the failing source
    std::cerr << "ERROR: " << e.what() << '\n';
    return 1;
  }

  // 6. Cleanup and Report
  if (outputFileStream.is_open()) {
    outputFileStream.close();
    if (!outputFileStream) {
      std::cerr << "ERROR: Failed to write to output file: "
                << normalize_path(config.outputFile) << '\n';
      return 1;
    }
  }

  if (config.verbose) {
    print_summary(stats, config);
  }
  return 0;
}
