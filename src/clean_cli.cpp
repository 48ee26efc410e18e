#include "gazeclean/blink_mask.hpp"
#include "gazeclean/csv_io.hpp"
#include "gazeclean/recovery.hpp"
#include "gazeclean/sample_ops.hpp"
#include "gazeclean/types.hpp"
#include "gazeclean/utils.hpp"
#include "gazeclean/version.hpp"

#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace gazeclean;

namespace {

struct Args {
  std::string samples_path;
  std::string events_path;
  std::string outdir{"out_gazeclean"};
  std::string mode{"interp-blinks"};

  // Empty => every recognized pupil channel present in the table.
  std::vector<std::string> fields;

  // Blink mask / recovery search.
  std::string blink_kind{"EBLINK"};
  std::string saccade_kind{"ESACC"};
  bool find_recovery{true};
  double z_thresh{0.1};
  size_t window{1000};
  size_t kernel{100};
  std::vector<std::string> pupil_fields = default_pupil_fields();

  // Interpolation.
  bool use_time{false};
  bool fill_edges{true};

  // Optional low-pass after cleaning (0 => disabled).
  double lowpass_cutoff{0.0};
  size_t lowpass_order{5};
};

static void print_help() {
  std::cout
      << "gazeclean_clean_cli (EyeLink blink / dropout cleanup)\n\n"
      << "Masks or interpolates untrustworthy pupil samples: blink events, saccades that\n"
      << "contain a blink (with their ends pushed to the pupil recovery point), or\n"
      << "zero-valued samples.\n\n"
      << "Outputs:\n"
      << "  cleaned_samples.csv   (same rows/columns as the input)\n"
      << "  mask_intervals.csv    (blink modes: intervals that were cleaned)\n"
      << "  recovery_report.csv   (blink modes with recovery: one row per interval)\n"
      << "  clean_summary.txt     (quick summary)\n\n"
      << "Usage:\n"
      << "  gazeclean_clean_cli --samples s.csv --events e.csv --outdir out --mode interp-blinks\n"
      << "  gazeclean_clean_cli --samples s.csv --outdir out --mode interp-zeros --fields pup_l\n\n"
      << "Options:\n"
      << "  --samples PATH          Sample table CSV (time column + channels)\n"
      << "  --events PATH           Event table CSV (onset,duration,kind); blink modes only\n"
      << "  --outdir DIR            Output directory (default: out_gazeclean)\n"
      << "  --mode MODE             mask-blinks | interp-blinks | mask-zeros | interp-zeros\n"
      << "                          (default: interp-blinks)\n"
      << "  --fields A,B            Channels to clean (default: recognized pupil channels)\n"
      << "\nBlink mask:\n"
      << "  --blink-kind TEXT       Blink event kind (default: EBLINK)\n"
      << "  --saccade-kind TEXT     Saccade event kind (default: ESACC)\n"
      << "  --no-recovery           Keep the reported event ends\n"
      << "  --z-thresh Z            Recovery |z| threshold (default: 0.1)\n"
      << "  --window N              Recovery search window in rows (default: 1000)\n"
      << "  --kernel N              Gradient smoothing kernel in rows (default: 100)\n"
      << "  --pupil-fields A,B      Recognized pupil channels (default: pup_l,pup_r,pa_left,pa_right)\n"
      << "\nInterpolation:\n"
      << "  --use-time              Interpolate against time keys instead of row order\n"
      << "  --no-fill-edges         Leave leading/trailing gaps as NaN\n"
      << "\nOptional smoothing (interp modes):\n"
      << "  --lowpass-cutoff F      Zero-phase Butterworth cutoff, fraction of Nyquist (0 = off)\n"
      << "  --lowpass-order N       Butterworth order (default: 5)\n"
      << "\n"
      << "  --version               Print version\n"
      << "  -h, --help              Show help\n";
}

static std::string require_value(int& i, int argc, char** argv, const std::string& flag) {
  if (i + 1 >= argc) throw std::runtime_error("Missing value for " + flag);
  return std::string(argv[++i]);
}

static size_t to_size(const std::string& s, const std::string& flag) {
  const int v = to_int(s);
  if (v < 0) throw std::runtime_error(flag + " must be >= 0");
  return static_cast<size_t>(v);
}

static Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      print_help();
      std::exit(0);
    } else if (arg == "--version") {
      std::cout << "gazeclean " << version_string() << " (" << build_type_string() << ")\n";
      std::exit(0);
    } else if (arg == "--samples") {
      a.samples_path = require_value(i, argc, argv, arg);
    } else if (arg == "--events") {
      a.events_path = require_value(i, argc, argv, arg);
    } else if (arg == "--outdir") {
      a.outdir = require_value(i, argc, argv, arg);
    } else if (arg == "--mode") {
      a.mode = require_value(i, argc, argv, arg);
    } else if (arg == "--fields") {
      a.fields = split_list(require_value(i, argc, argv, arg));
    } else if (arg == "--blink-kind") {
      a.blink_kind = require_value(i, argc, argv, arg);
    } else if (arg == "--saccade-kind") {
      a.saccade_kind = require_value(i, argc, argv, arg);
    } else if (arg == "--no-recovery") {
      a.find_recovery = false;
    } else if (arg == "--z-thresh") {
      a.z_thresh = to_double(require_value(i, argc, argv, arg));
    } else if (arg == "--window") {
      a.window = to_size(require_value(i, argc, argv, arg), arg);
    } else if (arg == "--kernel") {
      a.kernel = to_size(require_value(i, argc, argv, arg), arg);
    } else if (arg == "--pupil-fields") {
      a.pupil_fields = split_list(require_value(i, argc, argv, arg));
    } else if (arg == "--use-time") {
      a.use_time = true;
    } else if (arg == "--no-fill-edges") {
      a.fill_edges = false;
    } else if (arg == "--lowpass-cutoff") {
      a.lowpass_cutoff = to_double(require_value(i, argc, argv, arg));
    } else if (arg == "--lowpass-order") {
      a.lowpass_order = to_size(require_value(i, argc, argv, arg), arg);
    } else {
      throw std::runtime_error("Unknown argument: " + arg);
    }
  }
  return a;
}

static std::vector<std::string> default_fields(const SampleTable& samples,
                                               const std::vector<std::string>& pupil_fields) {
  std::vector<std::string> out;
  for (const auto& name : samples.channel_names) {
    for (const auto& p : pupil_fields) {
      if (name == p) {
        out.push_back(name);
        break;
      }
    }
  }
  return out;
}

static size_t count_status(const std::vector<RecoveryResult>& results, RecoveryStatus s) {
  size_t n = 0;
  for (const auto& r : results) {
    if (r.status == s) ++n;
  }
  return n;
}

} // namespace

int main(int argc, char** argv) {
  try {
    if (argc <= 1) {
      print_help();
      return 1;
    }

    const Args args = parse_args(argc, argv);

    const bool blink_mode = (args.mode == "mask-blinks" || args.mode == "interp-blinks");
    const bool zero_mode = (args.mode == "mask-zeros" || args.mode == "interp-zeros");
    const bool interp_mode = (args.mode == "interp-blinks" || args.mode == "interp-zeros");
    if (!blink_mode && !zero_mode) throw std::runtime_error("Unknown --mode: " + args.mode);
    if (args.samples_path.empty()) throw std::runtime_error("Missing required argument --samples");
    if (blink_mode && args.events_path.empty()) {
      throw std::runtime_error("--mode " + args.mode + " requires --events");
    }
    if (args.lowpass_cutoff > 0.0 && !interp_mode) {
      throw std::runtime_error("--lowpass-cutoff requires an interp-* mode (the filter cannot cross NaN gaps)");
    }

    ensure_directory(args.outdir);

    const SampleTable samples = read_sample_table_csv(args.samples_path);
    std::vector<std::string> fields = args.fields;
    if (fields.empty()) fields = default_fields(samples, args.pupil_fields);
    if (fields.empty()) throw std::runtime_error("No fields to clean (use --fields)");

    InterpolateOptions iopt;
    iopt.use_time_index = args.use_time;
    iopt.fill_edges = args.fill_edges;

    SampleTable cleaned;
    BlinkMaskReport rep;
    size_t n_rows_masked = 0;

    const std::filesystem::path outdir = std::filesystem::u8path(args.outdir);

    if (blink_mode) {
      const EventTable events = read_events_table(args.events_path);

      BlinkMaskOptions mopt;
      mopt.blink_kind = args.blink_kind;
      mopt.saccade_kind = args.saccade_kind;
      mopt.find_recovery = args.find_recovery;
      mopt.recovery.z_thresh = args.z_thresh;
      mopt.recovery.window = args.window;
      mopt.recovery.kernel_size = args.kernel;
      mopt.recovery.pupil_fields = args.pupil_fields;

      rep = eyelink_mask_report(samples, events, mopt);
      const std::vector<size_t> rows = event_row_positions(samples, rep.intervals);
      n_rows_masked = rows.size();

      cleaned = mask_rows(samples, fields, rows);
      if (interp_mode) interpolate_missing_inplace(&cleaned, fields, iopt);

      const std::string intervals_csv = (outdir / "mask_intervals.csv").u8string();
      write_events_csv(intervals_csv, rep.intervals);
      std::cout << "Wrote: " << intervals_csv << "\n";

      if (args.find_recovery) {
        const std::string report_csv = (outdir / "recovery_report.csv").u8string();
        write_recovery_report_csv(report_csv, rep.intervals, rep.recovery);
        std::cout << "Wrote: " << report_csv << "\n";
      }
    } else {
      cleaned = interp_mode ? interp_zeros(samples, fields, iopt) : mask_zeros(samples, fields);
    }

    if (args.lowpass_cutoff > 0.0) {
      LowpassOptions lopt;
      lopt.cutoff = args.lowpass_cutoff;
      lopt.order = args.lowpass_order;
      lowpass_fields_inplace(&cleaned, fields, lopt);
    }

    const std::string cleaned_csv = (outdir / "cleaned_samples.csv").u8string();
    write_sample_table_csv(cleaned_csv, cleaned);
    std::cout << "Wrote: " << cleaned_csv << "\n";

    const std::string summary_txt = (outdir / "clean_summary.txt").u8string();
    {
      std::ofstream f(summary_txt);
      if (!f) throw std::runtime_error("Failed to open for write: " + summary_txt);
      f << "gazeclean_clean_cli summary\n";
      f << "Version: " << version_string() << "\n";
      f << "Created (UTC): " << now_string_utc() << "\n";
      f << "Samples: " << args.samples_path << " (" << samples.n_rows() << " rows)\n";
      f << "Mode: " << args.mode << "\n";
      f << "Fields:";
      for (const auto& fl : fields) f << " " << fl;
      f << "\n";
      if (blink_mode) {
        f << "Blink events: " << rep.n_blinks << "\n";
        f << "Saccades containing a blink: " << rep.n_saccades << "\n";
        f << "Rows cleaned: " << n_rows_masked << "\n";
        if (args.find_recovery) {
          f << "Recovery: z_thresh=" << args.z_thresh << " window=" << args.window
            << " kernel=" << args.kernel << "\n";
          f << "  extended=" << count_status(rep.recovery, RecoveryStatus::kExtended) << "\n";
          f << "  already_recovered=" << count_status(rep.recovery, RecoveryStatus::kAlreadyRecovered) << "\n";
          f << "  threshold_not_reached=" << count_status(rep.recovery, RecoveryStatus::kThresholdNotReached) << "\n";
          f << "  window_collapsed=" << count_status(rep.recovery, RecoveryStatus::kWindowCollapsed) << "\n";
          f << "  end_unresolved=" << count_status(rep.recovery, RecoveryStatus::kEndUnresolved) << "\n";
          f << "  no_pupil_channel=" << count_status(rep.recovery, RecoveryStatus::kNoPupilChannel) << "\n";
        }
      }
      if (args.lowpass_cutoff > 0.0) {
        f << "Low-pass: cutoff=" << args.lowpass_cutoff << " order=" << args.lowpass_order << "\n";
      }
    }
    std::cout << "Wrote: " << summary_txt << "\n";

    if (blink_mode && args.find_recovery && !rep.recovery.empty() &&
        count_status(rep.recovery, RecoveryStatus::kNoPupilChannel) == rep.recovery.size()) {
      std::cerr << "Warning: no recognized pupil channel; event ends were not adjusted\n";
    }

    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 2;
  }
}
