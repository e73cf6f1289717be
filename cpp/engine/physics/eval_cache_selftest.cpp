/*
  Fragment 2.5t — Evaluation Cache Selftest

  Objective
  ---------
  Framework-free checks for EvalCache and CachedEvaluator:
    1) LRU order: a get() refreshes an entry, the oldest one is evicted.
    2) Hit/miss/insert/eviction counters.
    3) Keys separate inputs and physics-relevant config, and ignore
       solver/frontier settings.
    4) Many threads sharing one cache see exactly the uncached outputs.
*/

#include <cmath>
#include <iostream>
#include <string_view>
#include <thread>
#include <vector>

#include "engine/core/config.hpp"
#include "engine/core/eval_key.hpp"
#include "engine/core/point_inputs.hpp"
#include "engine/physics/eval_cache.hpp"
#include "engine/physics/point_evaluator.hpp"

namespace fusion::physics {
namespace {

static int g_fail_count = 0;

void expect_true(bool v, std::string_view msg) {
  if (!v) {
    ++g_fail_count;
    std::cerr << "[FAIL] " << msg << "\n";
  } else {
    std::cerr << "[ OK ] " << msg << "\n";
  }
}

OutputMap tagged(double pfus) {
  OutputMap m;
  m.Pfus_MW = pfus;
  return m;
}

void test_lru_eviction() {
  const EvalConfig cfg = EvalConfig::defaults();
  const PointInputs base = PointInputs::reference();
  const EvalKey k1 = make_eval_key(base.with("fG", 0.6), cfg);
  const EvalKey k2 = make_eval_key(base.with("fG", 0.7), cfg);
  const EvalKey k3 = make_eval_key(base.with("fG", 0.8), cfg);

  EvalCache cache(2);
  cache.put(k1, tagged(1.0));
  cache.put(k2, tagged(2.0));
  expect_true(cache.get(k1).has_value(), "k1 present");  // k1 now most recent
  cache.put(k3, tagged(3.0));

  expect_true(cache.size() == 2, "capacity respected");
  expect_true(!cache.get(k2).has_value(), "least recently used entry evicted");
  const auto v1 = cache.get(k1);
  const auto v3 = cache.get(k3);
  expect_true(v1 && v1->Pfus_MW == 1.0, "refreshed entry survives");
  expect_true(v3 && v3->Pfus_MW == 3.0, "newest entry present");

  const CacheStats s = cache.stats();
  expect_true(s.inserts == 3 && s.evictions == 1, "insert and eviction counters");
  expect_true(s.hits == 3 && s.misses == 1, "hit and miss counters");

  cache.set_max_entries(1);
  expect_true(cache.size() == 1 && cache.max_entries() == 1, "shrinking evicts down to capacity");
  cache.clear();
  expect_true(cache.size() == 0 && cache.stats().inserts == 0, "clear() drops entries and counters");
}

void test_key_content() {
  const EvalConfig cfg = EvalConfig::defaults();
  const PointInputs p = PointInputs::reference();

  const EvalKey a = make_eval_key(p, cfg);
  const EvalKey b = make_eval_key(p, cfg);
  expect_true(a == b && a.eval_id() == b.eval_id(), "same inputs/config -> same key");
  expect_true(!(make_eval_key(p.with("Bt_T", 12.3), cfg) == a), "input change -> new key");

  EvalConfig model = cfg;
  model.model.radiation_enabled = false;
  expect_true(!(make_eval_key(p, model) == a), "model switch -> new key");

  EvalConfig floors = cfg;
  floors.numerics.psol_floor_MW *= 2.0;
  expect_true(!(make_eval_key(p, floors) == a), "numerical floor -> new key");
  EvalConfig calib = cfg;
  calib.calibration.lambda_q = 1.1;
  expect_true(!(make_eval_key(p, calib) == a), "calibration multiplier -> new key");

  EvalConfig solver = cfg;
  solver.solver.max_iter = 99;
  solver.frontier.seed = 1234;
  expect_true(make_eval_key(p, solver) == a, "solver/frontier settings do not enter the key");

  const std::string id = a.eval_id();
  expect_true(id.size() == 3 * 16 + 10 && id.rfind("i_", 0) == 0, "eval_id format i_<16>__c_<16>__e_<16>");
}

void test_cached_evaluator() {
  const EvalConfig cfg = EvalConfig::defaults();
  EvalCache cache(16);
  const CachedEvaluator ev(cfg, &cache);
  const PointInputs p = PointInputs::reference();

  const OutputMap first = ev.evaluate(p);
  const OutputMap second = ev.evaluate(p);
  const OutputMap direct = evaluate(p, cfg);
  expect_true(first.Pfus_MW == direct.Pfus_MW && second.H98 == direct.H98, "cached outputs equal direct outputs");
  const CacheStats s = cache.stats();
  expect_true(s.misses == 1 && s.hits == 1 && s.inserts == 1, "second call is a hit");

  const CachedEvaluator plain(cfg);
  expect_true(plain.evaluate(p).Q_DT_eqv == direct.Q_DT_eqv, "null cache evaluates directly");
}

void test_concurrent_sharing() {
  const EvalConfig cfg = EvalConfig::defaults();
  const PointInputs base = PointInputs::reference();

  constexpr int kPoints = 12;
  constexpr int kThreads = 8;
  std::vector<PointInputs> pts;
  std::vector<OutputMap> expected;
  for (int i = 0; i < kPoints; ++i) {
    pts.push_back(base.with("fG", 0.5 + 0.05 * i));
    expected.push_back(evaluate(pts.back(), cfg));
  }

  EvalCache cache(8);
  std::vector<int> mismatches(kThreads, 0);
  std::vector<std::thread> pool;
  for (int t = 0; t < kThreads; ++t) {
    pool.emplace_back([&, t]() {
      const CachedEvaluator ev(cfg, &cache);
      for (int rep = 0; rep < 5; ++rep) {
        for (int i = 0; i < kPoints; ++i) {
          const int k = (i + t) % kPoints;
          const OutputMap got = ev.evaluate(pts[static_cast<size_t>(k)]);
          const OutputMap& want = expected[static_cast<size_t>(k)];
          if (got.Pfus_MW != want.Pfus_MW || got.H98 != want.H98 || got.q95 != want.q95) {
            ++mismatches[static_cast<size_t>(t)];
          }
        }
      }
    });
  }
  for (auto& th : pool) th.join();

  int total = 0;
  for (int m : mismatches) total += m;
  expect_true(total == 0, "8 threads sharing one cache see uncached outputs");
  expect_true(cache.size() <= 8, "shared cache stays within capacity");
  const CacheStats s = cache.stats();
  expect_true(s.hits + s.misses == static_cast<std::uint64_t>(kThreads * 5 * kPoints), "every lookup counted");
}

}  // namespace
}  // namespace fusion::physics

int main() {
  using namespace fusion::physics;

  test_lru_eviction();
  test_key_content();
  test_cached_evaluator();
  test_concurrent_sharing();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
