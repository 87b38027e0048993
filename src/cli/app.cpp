#include "cli/app.hpp"

#include <cctype>
#include <istream>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>

#include "config/config_loader.hpp"
#include "core/errors.hpp"
#include "engine/counting_engine.hpp"
#include "io/input_source.hpp"
#include "text/decoder.hpp"

namespace ccwc {

namespace {

void usage(std::ostream& os, const char* prog) {
  os << "Usage:\n"
     << "  " << prog << " [options] [FILE]...\n\n"
     << "Print newline, word, and byte counts for each FILE, and a total line if\n"
     << "more than one FILE is specified.  With no FILE, or when FILE is -, read\n"
     << "standard input.\n\n"
     << "Metrics:\n"
     << "  -c, --bytes            Print the byte counts\n"
     << "  -m, --chars            Print the character counts\n"
     << "  -l, --lines            Print the newline counts\n"
     << "  -w, --words            Print the word counts\n\n"
     << "Options:\n"
     << "  --buffer-size N        Bytes per read (0 = whole input at once, default 65536)\n"
     << "  --encoding NAME        Text encoding for character counts (default utf-8)\n"
     << "  --whitespace MODE      Word separators: ascii (default) or unicode\n"
     << "  --config FILE          Load counting settings from a YAML file\n"
     << "  --list-configs         List available YAML configs in configs/\n"
     << "  --list-encodings       List supported encodings\n"
     << "  --verbose              Print a trace line per input to stderr\n"
     << "  -h, --help             Show this help message\n\n"
     << "Examples:\n"
     << "  " << prog << " -l notes.txt todo.txt\n"
     << "  cat data.bin | " << prog << " -c\n"
     << "  " << prog << " -m --encoding utf-16le report.txt\n";
}

std::size_t parse_buffer_size(const std::string& text) {
  if (text.empty()) {
    throw std::invalid_argument("--buffer-size requires a number");
  }
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      throw std::invalid_argument("invalid --buffer-size '" + text +
                                  "': must be a non-negative integer");
    }
  }
  try {
    return static_cast<std::size_t>(std::stoull(text));
  } catch (const std::out_of_range&) {
    throw std::invalid_argument("invalid --buffer-size '" + text + "': too large");
  }
}

bool apply_short_flag(char flag, CliOptions& opts) {
  switch (flag) {
    case 'c': opts.metrics.insert(Metric::Bytes); return true;
    case 'm': opts.metrics.insert(Metric::Chars); return true;
    case 'l': opts.metrics.insert(Metric::Lines); return true;
    case 'w': opts.metrics.insert(Metric::Words); return true;
    case 'h': opts.help = true; return true;
    default: return false;
  }
}

}  // namespace

CliOptions parse_cli(int argc, const char* const argv[]) {
  CliOptions opts;
  bool options_done = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    if (options_done || arg == "-" || arg.empty() || arg[0] != '-') {
      opts.files.push_back(arg);
      continue;
    }
    if (arg == "--") { options_done = true; continue; }

    if (arg.rfind("--", 0) == 0) {
      std::string key = arg;
      std::optional<std::string> inline_value;
      const auto eq = arg.find('=');
      if (eq != std::string::npos) {
        key = arg.substr(0, eq);
        inline_value = arg.substr(eq + 1);
      }

      auto value = [&]() -> std::string {
        if (inline_value) return *inline_value;
        if (i + 1 >= argc) throw std::invalid_argument(key + " requires a value");
        return argv[++i];
      };
      auto no_value = [&]() {
        if (inline_value) throw std::invalid_argument(key + " does not take a value");
      };

      if (key == "--bytes") { no_value(); opts.metrics.insert(Metric::Bytes); continue; }
      if (key == "--chars") { no_value(); opts.metrics.insert(Metric::Chars); continue; }
      if (key == "--lines") { no_value(); opts.metrics.insert(Metric::Lines); continue; }
      if (key == "--words") { no_value(); opts.metrics.insert(Metric::Words); continue; }
      if (key == "--help") { no_value(); opts.help = true; continue; }
      if (key == "--verbose") { no_value(); opts.verbose = true; continue; }
      if (key == "--list-configs") { no_value(); opts.list_configs = true; continue; }
      if (key == "--list-encodings") { no_value(); opts.list_encodings = true; continue; }
      if (key == "--buffer-size") { opts.buffer_size = parse_buffer_size(value()); continue; }
      if (key == "--encoding") { opts.encoding = value(); continue; }
      if (key == "--whitespace") { opts.whitespace = parse_whitespace_mode(value()); continue; }
      if (key == "--config") { opts.config_file = value(); continue; }

      throw std::invalid_argument("Unknown argument: " + arg);
    }

    // Bundled short flags, e.g. -lw.
    for (std::size_t k = 1; k < arg.size(); ++k) {
      if (!apply_short_flag(arg[k], opts)) {
        throw std::invalid_argument("Unknown argument: " + arg);
      }
    }
  }
  return opts;
}

CountConfig resolve_config(const CliOptions& opts) {
  CountConfig cfg;
  if (!opts.config_file.empty()) {
    cfg = load_count_config(opts.config_file, cfg);
  }
  if (opts.buffer_size) cfg.chunk_size = *opts.buffer_size;
  if (opts.encoding) cfg.encoding = *opts.encoding;
  if (opts.whitespace) cfg.whitespace = *opts.whitespace;
  return cfg;
}

std::string format_counts(const CountResult& result, const std::string& name) {
  std::ostringstream line;
  bool first = true;
  line << ' ';
  for (Metric m : kAllMetrics) {
    if (!result.has(m)) continue;
    if (!first) line << ' ';
    line << result.value(m);
    first = false;
  }
  if (!name.empty()) line << ' ' << name;
  return line.str();
}

int run_cli(int argc, const char* const argv[], std::istream& in, std::ostream& out,
            std::ostream& err) {
  const char* prog = argc > 0 ? argv[0] : "ccwc";

  CliOptions opts;
  try {
    opts = parse_cli(argc, argv);
  } catch (const std::invalid_argument& e) {
    err << prog << ": " << e.what() << "\n";
    usage(err, prog);
    return kExitUsage;
  }

  if (opts.help) {
    usage(out, prog);
    return kExitOk;
  }
  if (opts.list_encodings) {
    for (const auto& name : Decoder::supported_names()) out << name << "\n";
    return kExitOk;
  }
  if (opts.list_configs) {
    out << "Available YAML configs in configs/:\n";
    const auto files = list_config_files("configs");
    if (files.empty()) {
      out << "  (none found)\n";
    } else {
      for (const auto& f : files) out << "  " << f << "\n";
    }
    return kExitOk;
  }

  CountConfig cfg;
  try {
    cfg = resolve_config(opts);
  } catch (const std::exception& e) {
    err << prog << ": " << e.what() << "\n";
    return kExitFailure;
  }

  // An unknown encoding is a configuration error: report it once, count nothing.
  std::optional<CountingEngine> engine;
  try {
    engine.emplace(cfg);
  } catch (const CountError& e) {
    err << prog << ": " << e.what() << "\n";
    return kExitFailure;
  }
  if (opts.verbose) engine->set_log(&err);

  const MetricSet requested = opts.metrics.empty() ? MetricSet::defaults() : opts.metrics;
  const bool implicit_stdin = opts.files.empty();
  std::vector<std::string> inputs = opts.files;
  if (implicit_stdin) inputs.push_back("-");

  int status = kExitOk;
  Counts total;
  for (const auto& name : inputs) {
    try {
      InputSource src = (name == "-") ? InputSource::borrow(in, "-") : InputSource::open_file(name);
      const CountResult result = engine->count(src, requested);
      out << format_counts(result, implicit_stdin ? "" : name) << "\n";
      total += result.counts();
    } catch (const CountError& e) {
      err << prog << ": " << e.what() << "\n";
      status = kExitFailure;
      if (e.is_fatal()) return status;
    }
  }

  if (inputs.size() > 1) {
    out << format_counts(CountResult(requested, total), "total") << "\n";
  }
  out.flush();
  return status;
}

}  // namespace ccwc
