/*
================================================================================
Fragment 7.0 — CLI: Command Dispatch (fusion_cli)
FILE: cpp/cli/cli_app.cpp

Purpose:
  - Command-line front-end for the point-design engine:
    * evaluate   one point -> outputs + constraint ledger (+ run artifact)
    * solve      bounded multi-target solve
    * solve-q    fG for a Q target (optionally Ip for an H98 target as well)
    * frontier   nearest-feasible search over declared levers

Exit codes (CI gating):
  0  ok / feasible / converged
  1  invalid arguments, parse/IO error, configuration error
  2  infeasible point or solver not converged
================================================================================
*/

#include "cli/cli_app.hpp"

#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "engine/constraints/ledger.hpp"
#include "engine/constraints/limits.hpp"
#include "engine/core/config.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/point_inputs.hpp"
#include "engine/frontier/nearest_feasible.hpp"
#include "engine/io/run_artifact.hpp"
#include "engine/io/run_artifact_parse.hpp"
#include "engine/physics/eval_cache.hpp"
#include "engine/physics/point_evaluator.hpp"
#include "engine/solvers/point_solver.hpp"
#include "engine/solvers/target_solver.hpp"

namespace fusion::cli {
namespace {

enum class ExitCode : int {
  kOk = 0,
  kError = 1,
  kNotOk = 2,
};

constexpr int code(ExitCode c) { return static_cast<int>(c); }

struct Args {
  std::string command;
  std::string in_path;
  std::string out_path;
  bool pretty = true;

  std::vector<std::pair<std::string, double>> sets;
  std::vector<solvers::TargetSpec> targets;
  std::vector<solvers::VariableSpec> vars;
  std::vector<frontier::Lever> levers;

  std::optional<std::string> scaling;
  std::optional<std::string> bootstrap;
  std::optional<int> n_random;
  std::optional<unsigned long long> seed;
  std::optional<int> threads;
  bool corners = false;

  std::optional<double> q_target;
  std::optional<double> h98_target;
  double fG_lo = 0.2;
  double fG_hi = 1.2;
  double Ip_lo = 2.0;
  double Ip_hi = 20.0;
};

void print_help(std::ostream& os) {
  os << R"(
fusion_cli - 0-D fusion point-design evaluator

Usage:
  fusion_cli <command> [options]

Commands:
  evaluate    Evaluate one point and check it against the default limits
  solve       Adjust variables so output keys hit targets
  solve-q     Solve fG for a Q target (add --h98 to also solve Ip for H98)
  frontier    Search levers for the nearest feasible sample
  help        Show this help message

Common options:
  --in <path>              JSON inputs (flat object or run artifact)
  --out <path|->           Write the run artifact JSON ("-" = stdout)
  --set key=value          Override one input field (repeatable)
  --scaling <name>         ipb98y2|iter89p|kaye_goldston|neo_alcator|mirnov|shimomura
  --bootstrap <name>       proxy|improved
  --pretty 0|1             Pretty JSON output (default 1)
  --log-level <lvl>        debug|info|warn|error (default warn)

solve:
  --target key=value       Output target (repeatable)
  --var key=x0:lo:hi       Free input variable (repeatable, same count as targets)

solve-q:
  --q <Q>                  Q_DT_eqv target (required)
  --fG-bounds lo:hi        default 0.2:1.2
  --h98 <H>                H98 target; enables the coupled Ip/fG solve
  --Ip-bounds lo:hi        default 2:20 (MA)

frontier:
  --lever key=lo:hi        Lever with bounds (repeatable)
  --target key=value       Optional ranking target (repeatable)
  --n <N>                  Random samples (default 200)
  --seed <S>               RNG seed (default 1)
  --threads <T>            Worker threads (default 1)
  --corners 0|1            Midpoint + corner probes (default 0)

Without --in the reference point is used:
  R0=1.81 a=0.57 kappa=1.8 Bt=12.2 Ip=8.0 Ti=15.0 fG=0.85 Paux=20.0

Exit Codes:
  0 - ok / feasible / converged
  1 - invalid arguments or I/O error
  2 - infeasible or not converged
)";
}

bool parse_double(std::string_view s, double* out) {
  const std::string tmp(s);
  char* end = nullptr;
  const double v = std::strtod(tmp.c_str(), &end);
  if (tmp.empty() || end != tmp.c_str() + tmp.size()) return false;
  if (!std::isfinite(v)) return false;
  *out = v;
  return true;
}

bool parse_int(std::string_view s, long long* out) {
  const std::string tmp(s);
  char* end = nullptr;
  errno = 0;
  const long long v = std::strtoll(tmp.c_str(), &end, 10);
  if (tmp.empty() || end != tmp.c_str() + tmp.size() || errno == ERANGE) return false;
  *out = v;
  return true;
}

// "a:b:c" -> doubles; count must match.
bool parse_colon_list(std::string_view s, size_t count, std::vector<double>* out) {
  out->clear();
  size_t start = 0;
  while (true) {
    const size_t pos = s.find(':', start);
    double v = 0.0;
    if (!parse_double(s.substr(start, pos == std::string_view::npos ? std::string_view::npos : pos - start), &v)) {
      return false;
    }
    out->push_back(v);
    if (pos == std::string_view::npos) break;
    start = pos + 1;
  }
  return out->size() == count;
}

bool split_kv(std::string_view s, std::string* key, std::string_view* value) {
  const size_t eq = s.find('=');
  if (eq == std::string_view::npos || eq == 0) return false;
  *key = std::string(s.substr(0, eq));
  *value = s.substr(eq + 1);
  return true;
}

bool get_next(int& i, int argc, char** argv, const char** out) {
  if (i + 1 >= argc) return false;
  *out = argv[++i];
  return true;
}

bool parse_args(int argc, char** argv, Args* a, std::string* err) {
  a->command = (argc >= 2) ? argv[1] : "help";

  for (int i = 2; i < argc; ++i) {
    const std::string k = argv[i];
    const char* v = nullptr;
    if (!get_next(i, argc, argv, &v)) {
      *err = k + " requires a value";
      return false;
    }
    const std::string_view sv(v);
    std::string key;
    std::string_view rest;
    std::vector<double> nums;

    if (k == "--in") {
      a->in_path = v;
    } else if (k == "--out") {
      a->out_path = v;
    } else if (k == "--pretty" || k == "--corners") {
      if (sv != "0" && sv != "1") { *err = k + " must be 0 or 1"; return false; }
      (k == "--pretty" ? a->pretty : a->corners) = (sv == "1");
    } else if (k == "--log-level") {
      const auto lvl = parse_log_level(sv);
      if (!lvl) { *err = "unknown log level: " + std::string(sv); return false; }
      set_log_level(*lvl);
    } else if (k == "--scaling") {
      a->scaling = v;
    } else if (k == "--bootstrap") {
      a->bootstrap = v;
    } else if (k == "--set") {
      double d = 0.0;
      if (!split_kv(sv, &key, &rest) || !parse_double(rest, &d)) { *err = "--set expects key=number"; return false; }
      a->sets.emplace_back(key, d);
    } else if (k == "--target") {
      double d = 0.0;
      if (!split_kv(sv, &key, &rest) || !parse_double(rest, &d)) { *err = "--target expects key=number"; return false; }
      a->targets.push_back({key, d});
    } else if (k == "--var") {
      if (!split_kv(sv, &key, &rest) || !parse_colon_list(rest, 3, &nums)) {
        *err = "--var expects key=x0:lo:hi";
        return false;
      }
      a->vars.push_back({key, nums[0], nums[1], nums[2]});
    } else if (k == "--lever") {
      if (!split_kv(sv, &key, &rest) || !parse_colon_list(rest, 2, &nums)) {
        *err = "--lever expects key=lo:hi";
        return false;
      }
      a->levers.push_back({key, nums[0], nums[1]});
    } else if (k == "--n" || k == "--threads" || k == "--seed") {
      long long n = 0;
      if (!parse_int(sv, &n) || n < 0) { *err = k + " expects a non-negative integer"; return false; }
      if (k != "--seed" && n > INT_MAX) { *err = k + " is out of range"; return false; }
      if (k == "--n") a->n_random = static_cast<int>(n);
      else if (k == "--threads") a->threads = static_cast<int>(n);
      else a->seed = static_cast<unsigned long long>(n);
    } else if (k == "--q" || k == "--h98") {
      double d = 0.0;
      if (!parse_double(sv, &d)) { *err = k + " expects a number"; return false; }
      (k == "--q" ? a->q_target : a->h98_target) = d;
    } else if (k == "--fG-bounds" || k == "--Ip-bounds") {
      if (!parse_colon_list(sv, 2, &nums)) { *err = k + " expects lo:hi"; return false; }
      if (k == "--fG-bounds") { a->fG_lo = nums[0]; a->fG_hi = nums[1]; }
      else { a->Ip_lo = nums[0]; a->Ip_hi = nums[1]; }
    } else {
      *err = "Unknown argument: " + k;
      return false;
    }
  }
  return true;
}

bool read_file(const std::string& path, std::string* out) {
  std::ifstream f(path, std::ios::binary);
  if (!f.good()) return false;
  std::ostringstream ss;
  ss << f.rdbuf();
  *out = ss.str();
  return true;
}

bool write_file(const std::string& path, const std::string& data) {
  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  if (!f.good()) return false;
  f.write(data.data(), static_cast<std::streamsize>(data.size()));
  return f.good();
}

EvalConfig make_config(const Args& a) {
  EvalConfig cfg = EvalConfig::defaults();
  if (a.scaling) cfg.model.comparator_scaling = parse_confinement_scaling(*a.scaling);
  if (a.bootstrap) cfg.model.bootstrap = parse_bootstrap_model(*a.bootstrap);
  if (a.n_random) cfg.frontier.n_random = *a.n_random;
  if (a.seed) cfg.frontier.seed = *a.seed;
  if (a.threads) cfg.frontier.n_threads = *a.threads;
  cfg.frontier.corner_probes = a.corners;
  cfg.validate_or_throw();
  return cfg;
}

PointInputs load_inputs(const Args& a) {
  PointInputs in = PointInputs::reference();
  if (!a.in_path.empty()) {
    std::string text;
    if (!read_file(a.in_path, &text)) throw IOError("failed to read file: " + a.in_path);
    io::JsonParseError perr;
    if (!io::parse_point_inputs_json(text, &in, &perr)) {
      std::ostringstream msg;
      msg << "parse error in " << a.in_path << ": " << perr.message << " @ " << perr.line << ":" << perr.col;
      throw IOError(msg.str());
    }
  }
  for (const auto& [k, v] : a.sets) in = in.with(k, v);
  return in;
}

void emit_artifact(const Args& a, const io::RunArtifact& art) {
  if (a.out_path.empty()) return;
  io::JsonWriteOptions jopt;
  jopt.pretty = a.pretty;
  const std::string json = io::run_artifact_to_json(art, jopt);
  if (a.out_path == "-") {
    std::cout << json;
    if (!std::cout.good()) throw IOError("failed to write stdout");
  } else if (!write_file(a.out_path, json)) {
    throw IOError("failed to write file: " + a.out_path);
  }
}

// Human report goes to stderr when the artifact is streamed to stdout.
std::ostream& report_stream(const Args& a) { return a.out_path == "-" ? std::cerr : std::cout; }

void print_headline(std::ostream& os, const OutputMap& out) {
  static const char* kKeys[] = {"Pfus_MW", "Q_DT_eqv", "H98", "betaN", "q95", "fG_eff", "P_SOL_MW",
                                "q_div_MW_m2", "B_peak_T", "TBR", "P_net_MW", "COE_USD_MWh"};
  os << "Outputs:\n";
  for (const char* k : kKeys) {
    os << "  " << std::left << std::setw(14) << k << " " << out.get(k) << "\n";
  }
}

void print_ledger(std::ostream& os, const constraints::Ledger& led) {
  os << "Constraints:\n";
  for (const auto& r : led.records) {
    os << "  [" << std::setw(7) << constraints::to_string(r.status) << "] " << std::left << std::setw(20)
       << r.name << " " << std::setw(4) << constraints::to_string(r.severity) << " value=" << r.value << " "
       << constraints::to_string(r.sense) << " " << r.bound << " margin_frac=" << r.margin_frac << "\n";
  }
  os << "Verdict: " << constraints::to_string(led.verdict);
  if (led.dominant) os << " (dominant: " << led.dominant->name << ")";
  os << "\n";
}

int cmd_evaluate(const Args& a) {
  try {
    const EvalConfig cfg = make_config(a);
    const PointInputs in = load_inputs(a);
    const OutputMap out = physics::evaluate(in, cfg);
    const constraints::Ledger led = constraints::build_ledger(out, constraints::default_limit_table(in));

    std::ostream& os = report_stream(a);
    print_headline(os, out);
    print_ledger(os, led);
    emit_artifact(a, io::make_run_artifact(in, out, led, cfg));
    return code(led.overall_ok ? ExitCode::kOk : ExitCode::kNotOk);

  } catch (const ConfigurationError& e) {
    std::cerr << "Configuration error: " << e.what() << "\n";
    return code(ExitCode::kError);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return code(ExitCode::kError);
  }
}

int cmd_solve(const Args& a) {
  try {
    if (a.targets.empty()) {
      std::cerr << "solve: at least one --target is required\n";
      return code(ExitCode::kError);
    }
    const EvalConfig cfg = make_config(a);
    const PointInputs base = load_inputs(a);
    physics::EvalCache cache(cfg.cache.max_entries);
    const solvers::SolveResult res = solvers::solve_for_targets(base, a.targets, a.vars, cfg, &cache);
    const constraints::Ledger led =
        constraints::build_ledger(res.outputs, constraints::default_limit_table(res.inputs));

    std::ostream& os = report_stream(a);
    os << "Solve: " << res.message << " (ok=" << (res.ok ? "true" : "false") << ", iterations="
       << res.iterations << ")\n";
    for (const auto& v : a.vars) os << "  " << v.key << " = " << res.inputs.get(v.key) << "\n";
    for (size_t i = 0; i < a.targets.size() && i < res.residuals.size(); ++i) {
      os << "  " << a.targets[i].key << " target=" << a.targets[i].value
         << " residual=" << res.residuals[i] << "\n";
    }
    print_ledger(os, led);

    io::RunArtifact art = io::make_run_artifact(res.inputs, res.outputs, led, cfg);
    io::attach_solve(art, res, a.targets);
    emit_artifact(a, art);
    return code(res.ok ? ExitCode::kOk : ExitCode::kNotOk);

  } catch (const ConfigurationError& e) {
    std::cerr << "Configuration error: " << e.what() << "\n";
    return code(ExitCode::kError);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return code(ExitCode::kError);
  }
}

int cmd_solve_q(const Args& a) {
  try {
    if (!a.q_target) {
      std::cerr << "solve-q: --q is required\n";
      return code(ExitCode::kError);
    }
    const EvalConfig cfg = make_config(a);
    const PointInputs base = load_inputs(a);
    physics::EvalCache cache(cfg.cache.max_entries);

    const solvers::PointSolveResult res =
        a.h98_target ? solvers::solve_Ip_for_H98_with_Q(base, *a.h98_target, *a.q_target, a.Ip_lo, a.Ip_hi,
                                                        a.fG_lo, a.fG_hi, cfg, &cache)
                     : solvers::solve_fG_for_Q(base, *a.q_target, a.fG_lo, a.fG_hi, cfg, &cache);
    const constraints::Ledger led =
        constraints::build_ledger(res.outputs, constraints::default_limit_table(res.inputs));

    std::ostream& os = report_stream(a);
    os << "Point solve (" << res.method << "): " << res.message << "\n";
    os << "  fG = " << res.inputs.fG << "  Ip_MA = " << res.inputs.Ip_MA << "\n";
    os << "  Q_DT_eqv = " << res.outputs.Q_DT_eqv << "  H98 = " << res.outputs.H98 << "\n";
    if (res.clamped) os << "  clamped on " << res.clamped_on << "\n";
    print_ledger(os, led);

    emit_artifact(a, io::make_run_artifact(res.inputs, res.outputs, led, cfg));
    return code(res.ok && !res.clamped ? ExitCode::kOk : ExitCode::kNotOk);

  } catch (const ConfigurationError& e) {
    std::cerr << "Configuration error: " << e.what() << "\n";
    return code(ExitCode::kError);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return code(ExitCode::kError);
  }
}

int cmd_frontier(const Args& a) {
  try {
    if (a.levers.empty()) {
      std::cerr << "frontier: at least one --lever is required\n";
      return code(ExitCode::kError);
    }
    const EvalConfig cfg = make_config(a);
    const PointInputs base = load_inputs(a);
    physics::EvalCache cache(cfg.cache.max_entries);

    std::vector<frontier::FrontierTarget> targets;
    for (const auto& t : a.targets) targets.push_back({t.key, t.value});
    const frontier::FrontierReport rep = frontier::find_nearest_feasible(base, a.levers, targets, cfg, {}, &cache);

    std::ostream& os = report_stream(a);
    os << "Frontier: " << rep.status << " (" << rep.n_feasible << " feasible of " << rep.n_evaluated
       << " evaluated)\n";
    if (rep.ok) {
      os << "  distance = " << rep.best_distance << "\n";
      for (const auto& [k, v] : rep.best_levers) os << "  " << k << " = " << v << "\n";
      for (const auto& [k, v] : rep.best_achieved) os << "  " << k << " achieved " << v << "\n";
    } else if (rep.least_violating) {
      const auto& lv = *rep.least_violating;
      os << "  least violating sample #" << lv.index << " (" << frontier::to_string(lv.kind)
         << "): hard failures=" << lv.n_hard_failed << " dominant=" << lv.dominant << "\n";
      for (const auto& [k, v] : lv.levers) os << "  " << k << " = " << v << "\n";
    }

    const constraints::Ledger led =
        constraints::build_ledger(rep.best_outputs, constraints::default_limit_table(rep.best_inputs));
    emit_artifact(a, io::make_run_artifact(rep.best_inputs, rep.best_outputs, led, cfg));
    return code(rep.ok ? ExitCode::kOk : ExitCode::kNotOk);

  } catch (const ConfigurationError& e) {
    std::cerr << "Configuration error: " << e.what() << "\n";
    return code(ExitCode::kError);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return code(ExitCode::kError);
  }
}

}  // namespace

int run(int argc, char** argv) {
  set_log_level(LogLevel::WARN);

  Args a;
  std::string arg_err;
  if (!parse_args(argc, argv, &a, &arg_err)) {
    std::cerr << "Argument error: " << arg_err << "\n";
    std::cerr << "Run 'fusion_cli help' for usage information.\n";
    return code(ExitCode::kError);
  }

  if (a.command == "help" || a.command == "-h" || a.command == "--help") {
    print_help(std::cout);
    return code(ExitCode::kOk);
  }
  if (a.command == "evaluate") return cmd_evaluate(a);
  if (a.command == "solve") return cmd_solve(a);
  if (a.command == "solve-q") return cmd_solve_q(a);
  if (a.command == "frontier") return cmd_frontier(a);

  std::cerr << "Unknown command: " << a.command << "\n";
  std::cerr << "Run 'fusion_cli help' for usage information.\n";
  return code(ExitCode::kError);
}

}  // namespace fusion::cli
