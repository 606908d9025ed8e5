#include "test_support.hpp"

#include <simdjson.h>
#include <cstdlib>
#include <string>
#include <sys/wait.h>

static std::string env_or(const char* k, const char* defv) {
  const char* v = std::getenv(k);
  return (v && *v) ? std::string(v) : std::string(defv);
}

// Runs the CLI with stdout captured into `out`; returns the exit status.
static int run(const std::string& bin, const std::string& args, const fs::path& out) {
  std::string cmd = "\"" + bin + "\" " + args + " >\"" + out.string() + "\" 2>&1";
  int rc = std::system(cmd.c_str());
  return (rc == -1) ? -1 : WEXITSTATUS(rc);
}

int main() {
  const std::string bin = env_or("JR_CLI_BIN", "jsonl-index");
  jr_test::TempDir dir("cli");
  const fs::path f = dir / "data.jsonl";
  jr_test::write_text(f, jr_test::numbered_jsonl(0, 25) + "oops\n");
  const fs::path out = dir / "out.txt";
  const std::string file = "\"" + f.string() + "\"";

  JR_CHECK(run(bin, "info " + file + " --json --interval=4", out) == 0, "info exits 0: " << jr_test::read_text(out));
  {
    simdjson::ondemand::parser p;
    auto json = simdjson::padded_string::load(out.string());
    auto doc = p.iterate(json);
    std::uint64_t lines = 0;
    (void)doc["lines"].get_uint64().get(lines);
    std::uint64_t interval = 0;
    (void)doc["checkpoint_interval"].get_uint64().get(interval);
    bool existed = true;
    (void)doc["index_exists"].get_bool().get(existed);
    JR_CHECK(lines == 26 && interval == 4 && !existed, "info --json fields");
  }
  JR_CHECK(fs::exists(f.string() + ".idx"), "info writes the sidecar");
  JR_CHECK(run(bin, "info " + file, out) == 0, "plain info");
  JR_CHECK(jr_test::read_text(out).find("Lines: 26") != std::string::npos, "plain info text");

  JR_CHECK(run(bin, "read " + file + " 3 0", out) == 0, "read exits 0");
  JR_CHECK(jr_test::read_text(out) ==
           "{\"id\":3,\"name\":\"item-3\"}\n{\"id\":0,\"name\":\"item-0\"}\n", "read output");

  {
    const fs::path spaced = dir / "spaced.jsonl";
    const std::string line = "{ \"id\" : 1 , \"tags\" : [1, 2] }";
    jr_test::write_text(spaced, line + "\r\n{\"id\":2}\n");
    JR_CHECK(run(bin, "read \"" + spaced.string() + "\" 0", out) == 0, "read valid spaced line");
    JR_CHECK(jr_test::read_text(out) == line + "\n", "read prints the stored line, not a re-encoding: "
             << jr_test::read_text(out));
  }

  JR_CHECK(run(bin, "read " + file + " 99", out) == 1, "out of range exits 1");
  JR_CHECK(run(bin, "read " + file + " 25", out) == 1, "undecodable line exits 1");

  JR_CHECK(run(bin, "sample " + file + " 5 --seed=7", out) == 0, "sample exits 0");
  const std::string first = jr_test::read_text(out);
  JR_CHECK(run(bin, "sample " + file + " 5 --seed=7", out) == 0 && jr_test::read_text(out) == first,
           "seeded sample is reproducible");
  JR_CHECK(run(bin, "sample " + file + " 100", out) == 1, "oversized sample exits 1");

  JR_CHECK(run(bin, "frobnicate " + file, out) == 2, "unknown command exits 2");
  JR_CHECK(run(bin, "info \"" + (dir / "missing.jsonl").string() + "\"", out) == 1, "missing file exits 1");

  std::cout << "[PASS] cli\n";
  return 0;
}
