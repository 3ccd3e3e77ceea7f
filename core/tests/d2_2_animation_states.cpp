// D2.2: timed Deleting / Appending / Waiting states.

#include "ps/anim/TextAnimation.hpp"

#include <cstdio>
#include <cstdlib>
#include <variant>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

int main() {
  // Test 1: delete shrinks monotonically to the desired length
  {
    ps::AnimationState s = ps::applyRequest(ps::DeleteRequest{5, 1.5}, U"hello world", 10.0);
    requireTrue(std::holds_alternative<ps::Deleting>(s), "deleting");
    requireTrue(ps::targetLength(s) == 5, "target 5");

    ps::update(s, 10.0);
    requireTrue(ps::currentText(s) == U"hello world", "nothing deleted at start");

    std::size_t prev = ps::currentText(s).size();
    for (int i = 1; i <= 150; i++) {
      double now = 10.0 + i * 0.01;
      ps::update(s, now);
      std::size_t len = ps::currentText(s).size();
      requireTrue(len <= prev, "length never grows while deleting");
      requireTrue(len >= 5, "never below the desired length");
      requireTrue(std::u32string(U"hello world").compare(0, len, ps::currentText(s)) == 0,
                  "always a prefix of the start text");
      prev = len;
    }
    requireTrue(ps::currentText(s) == U"hello", "exactly the desired text at the end");
    requireTrue(!ps::isFinished(s, 11.49), "not finished early");
    requireTrue(ps::isFinished(s, 11.5), "finished at start + duration");
    std::printf("Test 1 (deleting): PASS\n");
  }

  // Test 2: desired length beyond the text clamps to a no-op
  {
    ps::AnimationState s = ps::applyRequest(ps::DeleteRequest{20, 1.0}, U"abc", 0.0);
    requireTrue(std::get<ps::Deleting>(s).desiredLen == 3, "clamped to base length");
    ps::update(s, 2.0);
    requireTrue(ps::currentText(s) == U"abc", "text untouched");
    std::printf("Test 2 (delete clamp): PASS\n");
  }

  // Test 3: append grows monotonically, following the ease curve
  {
    ps::AnimationState s = ps::applyRequest(ps::AppendRequest{U"cdef", 1.0}, U"ab", 0.0);
    requireTrue(ps::targetLength(s) == 6, "target 6");
    ps::update(s, 0.0);
    requireTrue(ps::currentText(s) == U"ab", "nothing typed at start");

    ps::update(s, 0.5);  // 4 * (1 - cos(pi/4)) = 1.17
    requireTrue(ps::currentText(s) == U"abc", "one char at half time");

    std::size_t prev = ps::currentText(s).size();
    for (int i = 51; i <= 100; i++) {
      ps::update(s, i * 0.01);
      std::size_t len = ps::currentText(s).size();
      requireTrue(len >= prev, "length never shrinks while appending");
      requireTrue(std::u32string(U"abcdef").compare(0, len, ps::currentText(s)) == 0,
                  "always a prefix of the final text");
      prev = len;
    }
    requireTrue(ps::currentText(s) == U"abcdef", "complete at the end");
    requireTrue(std::get<ps::Appending>(s).pending.empty(), "pending drained");
    std::printf("Test 3 (appending): PASS\n");
  }

  // Test 4: wait ends strictly after its end time
  {
    ps::AnimationState s = ps::applyRequest(ps::WaitRequest{2.0}, U"keep", 1.0);
    requireTrue(std::holds_alternative<ps::Waiting>(s), "waiting");
    ps::update(s, 5.0);
    requireTrue(ps::currentText(s) == U"keep", "text unchanged");
    requireTrue(!ps::isFinished(s, 3.0), "not finished at end time");
    requireTrue(ps::isFinished(s, 3.01), "finished after end time");
    std::printf("Test 4 (waiting): PASS\n");
  }

  // Test 5: idle is always finished
  {
    ps::AnimationState s = ps::Idle{U"x"};
    requireTrue(ps::isFinished(s, -100.0), "idle finished");
    ps::update(s, 1.0);
    requireTrue(ps::currentText(s) == U"x", "idle text");
    std::printf("Test 5 (idle): PASS\n");
  }

  // Test 6: finishing early yields the final text
  {
    ps::AnimationState d = ps::applyRequest(ps::DeleteRequest{2, 1.0}, U"abcdef", 0.0);
    requireTrue(ps::intoFinishedString(d) == U"ab", "delete settles");

    ps::AnimationState a = ps::applyRequest(ps::AppendRequest{U"xyz", 1.0}, U"ab", 0.0);
    ps::update(a, 0.3);
    requireTrue(ps::intoFinishedString(a) == U"abxyz", "append settles");

    ps::AnimationState w = ps::applyRequest(ps::WaitRequest{1.0}, U"w", 0.0);
    requireTrue(ps::intoFinishedString(w) == U"w", "wait text");
    std::printf("Test 6 (into finished string): PASS\n");
  }

  // Test 7: zero duration completes immediately
  {
    ps::AnimationState s = ps::applyRequest(ps::AppendRequest{U"now", 0.0}, U"", 3.0);
    requireTrue(ps::isFinished(s, 3.0), "finished at once");
    ps::update(s, 3.0);
    requireTrue(ps::currentText(s) == U"now", "all typed");
    std::printf("Test 7 (zero duration): PASS\n");
  }

  // Test 8: time fraction clamps
  {
    requireTrue(ps::timeFraction(1.0, 2.0, 0.0) == 0.0f, "before start");
    requireTrue(ps::timeFraction(1.0, 2.0, 2.0) == 0.5f, "midway");
    requireTrue(ps::timeFraction(1.0, 2.0, 9.0) == 1.0f, "after end");
    std::printf("Test 8 (time fraction): PASS\n");
  }

  std::printf("\nAll animation state tests passed.\n");
  return 0;
}
