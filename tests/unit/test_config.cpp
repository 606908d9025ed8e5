#include "jsonl_resumable/config.hpp"
#include "jsonl_resumable/errors.hpp"
#include "test_support.hpp"

#include <cstdlib>

int main() {
  JR_CHECK(jr::parse_u64("1000") == 1000u, "u64");
  JR_CHECK(!jr::parse_u64("10x") && !jr::parse_u64("") && !jr::parse_u64("-1"), "u64 rejects junk");
  JR_CHECK(jr::parse_seconds("2.5") == 2.5, "fractional seconds");
  JR_CHECK(!jr::parse_seconds("-1") && !jr::parse_seconds("inf") && !jr::parse_seconds("5s"), "bad seconds");
  JR_CHECK(jr::parse_seconds("1e9") == 1e9, "upper bound accepted");
  JR_CHECK(!jr::parse_seconds("1e300") && !jr::parse_seconds("1000000001"), "huge seconds rejected");
  JR_CHECK(jr::parse_flag("YES") == true && jr::parse_flag("off") == false, "flags");
  JR_CHECK(!jr::parse_flag("maybe"), "flag rejects junk");

  ::setenv("JR_CHECKPOINT_INTERVAL", "250", 1);
  ::setenv("JR_KEEP_OPEN", "true", 1);
  ::setenv("JR_CHUNK_BYTES", "4096", 1);
  jr::JsonlIndex::Config icfg;
  jr::apply_env(icfg);
  JR_CHECK(icfg.checkpoint_interval == 250 && icfg.keep_open && icfg.chunk_bytes == 4096, "index env");

  ::setenv("JR_PROGRESS_DIR", "/tmp/jr-progress", 1);
  ::setenv("JR_CHECKPOINT_EVERY_LINES", "0", 1);
  ::setenv("JR_CHECKPOINT_EVERY_SEC", "0.25", 1);
  jr::BatchProcessor::Config bcfg;
  jr::apply_env(bcfg);
  JR_CHECK(bcfg.progress_dir == "/tmp/jr-progress", "progress dir");
  JR_CHECK(bcfg.checkpoint_every_lines == 0, "line trigger disabled");
  JR_CHECK(bcfg.checkpoint_every == std::chrono::milliseconds(250), "time trigger");

  ::setenv("JR_CHECKPOINT_EVERY_SEC", "1e300", 1);
  JR_CHECK(jr_test::throws<jr::Error>([]{ jr::BatchProcessor::Config c; jr::apply_env(c); }),
           "out-of-range seconds");
  ::setenv("JR_CHECKPOINT_EVERY_SEC", "", 1);

  ::setenv("JR_CHECKPOINT_INTERVAL", "0", 1);
  JR_CHECK(jr_test::throws<jr::Error>([]{ jr::JsonlIndex::Config c; jr::apply_env(c); }), "zero interval");
  ::setenv("JR_CHECKPOINT_INTERVAL", "", 1);
  jr::JsonlIndex::Config untouched;
  untouched.checkpoint_interval = 9;
  ::setenv("JR_KEEP_OPEN", "0", 1);
  jr::apply_env(untouched);
  JR_CHECK(untouched.checkpoint_interval == 9 && !untouched.keep_open, "empty var leaves field alone");

  JR_CHECK(jr::env_or("JR_SURELY_UNSET_VAR", "dflt") == "dflt", "env_or default");

  std::cout << "[PASS] config\n";
  return 0;
}
