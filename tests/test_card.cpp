#include <catch2/catch_test_macros.hpp>
#include <random>
#include <string>
#include <vector>
#include <edudraw/card.hpp>
#include <edudraw/scheduler.hpp>

using namespace edudraw;

TEST_CASE("CardRevealSimulator timeline") {
  ManualScheduler sched;
  std::mt19937 rng(4);
  CardRevealSimulator card(sched, rng);
  int done = 0;
  std::vector<AudioCue> cues;
  card.set_cue_sink([&](AudioCue c) { cues.push_back(c); });

  REQUIRE(card.step() == CardStep::Idle);
  REQUIRE(card.start({"Ann", "Ben", "Cat"}, Winner{2, "Cat"}, [&] { ++done; }));
  REQUIRE(card.step() == CardStep::Shuffling);
  REQUIRE(card.deck_size() == 3);
  for (std::size_t i = 0; i < card.deck_size(); ++i) {
    const CardFace f = card.face(i);
    REQUIRE(f.visible);
    REQUIRE_FALSE(f.face_up);
    REQUIRE(f.label.empty());
  }

  SECTION("picking, reveal, done") {
    sched.advance_to(1999);
    REQUIRE(card.step() == CardStep::Shuffling);

    sched.advance_to(2000);
    REQUIRE(card.step() == CardStep::Picking);
    REQUIRE_FALSE(card.face(0).visible);
    REQUIRE(card.face(1).visible);
    REQUIRE(card.face(1).emphasized);
    REQUIRE(card.face(1).label.empty());

    sched.advance_to(3000);
    REQUIRE(card.step() == CardStep::Revealed);
    REQUIRE(card.phase() == SimPhase::Concluding);
    REQUIRE(card.face(1).face_up);
    REQUIRE(card.face(1).label == "Cat");
    REQUIRE_FALSE(card.face(2).visible);
    REQUIRE(cues == std::vector<AudioCue>{AudioCue::CardReveal});

    sched.advance_to(4999);
    REQUIRE(done == 0);
    sched.advance_to(5000);
    REQUIRE(done == 1);
    REQUIRE(card.phase() == SimPhase::Done);
    REQUIRE(card.face(1).label == "Cat");  // stays on the revealed card
    REQUIRE(sched.idle());
  }

  SECTION("cancel before the reveal") {
    sched.advance_to(2500);
    card.cancel();
    REQUIRE(card.step() == CardStep::Idle);
    sched.advance_to(10000);
    REQUIRE(done == 0);
    REQUIRE(cues.empty());
  }

  SECTION("positions outside the deck are hidden") {
    REQUIRE_FALSE(card.face(3).visible);
  }
}

TEST_CASE("CardRevealSimulator only needs a winner name") {
  ManualScheduler sched;
  std::mt19937 rng(4);
  CardRevealSimulator card(sched, rng);
  REQUIRE_FALSE(card.start({"Ann"}, Winner{0, ""}, [] {}));
  REQUIRE(card.start({}, Winner{7, "Zed"}, [] {}));
}

TEST_CASE("CardConfig is sanitised") {
  ManualScheduler sched;
  std::mt19937 rng(4);
  CardConfig cfg;
  cfg.deck_size = 5;
  cfg.reveal_position = 9;
  CardRevealSimulator card(sched, rng, cfg);
  REQUIRE(card.config().reveal_position == 2);
  REQUIRE(to_string(CardStep::Revealed) == std::string("revealed"));
}
