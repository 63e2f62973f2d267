#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <catch2/catch.hpp>

#include "TestSupport.hpp"

TEST_CASE("Publish stamps events that carry no timestamp", "[bus]") {
  BusFixture fixture;
  Recorder<CharacterDeletedEvent> deleted;
  auto handle = deleted.SubscribeTo(*fixture.bus);

  const auto before = EventClock::now();
  fixture.bus->Publish(CharacterDeletedEvent{.character_id = "c1", .character_name = "Aria"});

  CharacterDeletedEvent stamped_by_caller{.character_id = "c2", .character_name = "Bram"};
  stamped_by_caller.timestamp = Timestamp{} + std::chrono::hours(1);
  fixture.bus->Publish(stamped_by_caller);
  fixture.Settle();

  auto events = deleted.Events();
  REQUIRE(events.size() == 2);
  CHECK(events[0].HasTimestamp());
  CHECK(events[0].timestamp >= before);
  CHECK(events[1].timestamp == Timestamp{} + std::chrono::hours(1));
}

TEST_CASE("Unsubscribing one handler leaves the others subscribed", "[bus]") {
  BusFixture fixture;
  std::atomic<int> first{0};
  std::atomic<int> second{0};

  auto first_handle = fixture.bus->Subscribe<CharacterPromotedEvent>([&](const CharacterPromotedEvent&) { ++first; });
  auto second_handle = fixture.bus->Subscribe<CharacterPromotedEvent>([&](const CharacterPromotedEvent&) { ++second; });
  REQUIRE(fixture.bus->SubscriberCount("character.promoted") == 2);

  first_handle.Unsubscribe();
  first_handle.Unsubscribe();

  fixture.bus->Publish(CharacterPromotedEvent{.character_id = "c1"});
  fixture.Settle();

  CHECK(first == 0);
  CHECK(second == 1);
  CHECK_FALSE(first_handle.IsActive());
  CHECK(second_handle.IsActive());
  CHECK(fixture.bus->SubscriberCount("character.promoted") == 1);
}

TEST_CASE("Events are delivered in publish order", "[bus]") {
  BusFixture fixture;
  Recorder<CharacterAppearanceEvent> appearances;
  auto handle = appearances.SubscribeTo(*fixture.bus);

  for (int chapter = 1; chapter <= 50; ++chapter) {
    fixture.bus->Publish(CharacterAppearanceEvent{.character_id = "c1", .chapter_number = chapter});
  }
  fixture.Settle();

  auto events = appearances.Events();
  REQUIRE(events.size() == 50);
  for (int i = 0; i < 50; ++i) {
    CHECK(events[i].chapter_number == i + 1);
  }
}

TEST_CASE("An event is fully handled before the next one starts", "[bus]") {
  BusFixture fixture;
  std::atomic<int> in_flight{0};
  std::atomic<bool> overlapped{false};

  auto slow = [&](const CharacterAppearanceEvent&) {
    if (++in_flight > 3) {
      overlapped = true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    --in_flight;
  };
  auto a = fixture.bus->Subscribe<CharacterAppearanceEvent>(slow);
  auto b = fixture.bus->Subscribe<CharacterAppearanceEvent>(slow);
  auto c = fixture.bus->Subscribe<CharacterAppearanceEvent>(slow);

  for (int chapter = 0; chapter < 10; ++chapter) {
    fixture.bus->Publish(CharacterAppearanceEvent{.character_id = "c1", .chapter_number = chapter});
  }
  fixture.Settle();

  CHECK_FALSE(overlapped);
}

TEST_CASE("A one-shot subscription fires once and removes itself", "[bus]") {
  BusFixture fixture;
  std::atomic<int> once_calls{0};
  std::atomic<int> regular_calls{0};

  auto once = fixture.bus->SubscribeOnce<CharacterCreatedEvent>([&](const CharacterCreatedEvent&) { ++once_calls; });
  auto regular = fixture.bus->Subscribe<CharacterCreatedEvent>([&](const CharacterCreatedEvent&) { ++regular_calls; });

  for (int i = 0; i < 3; ++i) {
    fixture.bus->Publish(CharacterCreatedEvent{.character = Character{.id = std::to_string(i), .name = "c"}});
  }
  fixture.Settle();

  CHECK(once_calls == 1);
  CHECK(regular_calls == 3);
  CHECK_FALSE(once.IsActive());
  CHECK(fixture.bus->SubscriberCount("character.created") == 1);
}

TEST_CASE("A throwing handler does not stop its siblings or later events", "[bus]") {
  BusFixture fixture;
  std::atomic<int> survivor_calls{0};

  auto failing = fixture.bus->Subscribe<CharacterDemotedEvent>(
    [](const CharacterDemotedEvent&) { throw std::runtime_error("handler failure"); });
  auto survivor =
    fixture.bus->Subscribe<CharacterDemotedEvent>([&](const CharacterDemotedEvent&) { ++survivor_calls; });

  fixture.bus->Publish(CharacterDemotedEvent{.character_id = "c1"});
  fixture.bus->Publish(CharacterDemotedEvent{.character_id = "c2"});
  fixture.Settle();

  CHECK(survivor_calls == 2);
  const EventBusStats stats = fixture.bus->Stats();
  CHECK(stats.handler_failures == 2);
  CHECK(stats.published == 2);
  CHECK(stats.delivered == 2);
}

TEST_CASE("A handler throwing a non-standard value is counted as a failure", "[bus]") {
  BusFixture fixture;
  std::atomic<int> survivor_calls{0};

  auto failing = fixture.bus->Subscribe<CharacterDeletedEvent>([](const CharacterDeletedEvent&) { throw 42; });
  auto survivor =
    fixture.bus->Subscribe<CharacterDeletedEvent>([&](const CharacterDeletedEvent&) { ++survivor_calls; });

  fixture.bus->Publish(CharacterDeletedEvent{.character_id = "c1"});
  fixture.Settle();

  CHECK(survivor_calls == 1);
  CHECK(fixture.bus->Stats().handler_failures == 1);
}

TEST_CASE("Subscriptions made during delivery apply from the next event", "[bus]") {
  BusFixture fixture;
  std::atomic<int> late_calls{0};
  EventHandle late;

  auto registrar = fixture.bus->SubscribeOnce<CharacterDeletedEvent>([&](const CharacterDeletedEvent&) {
    late = fixture.bus->Subscribe<CharacterDeletedEvent>([&](const CharacterDeletedEvent&) { ++late_calls; });
  });

  fixture.bus->Publish(CharacterDeletedEvent{.character_id = "first"});
  fixture.Settle();
  CHECK(late_calls == 0);

  fixture.bus->Publish(CharacterDeletedEvent{.character_id = "second"});
  fixture.Settle();
  CHECK(late_calls == 1);
}

TEST_CASE("PublishAsync completes after the cascades it started", "[bus]") {
  BusFixture fixture;
  Recorder<CharacterAppearanceEvent> appearances;
  auto recorder = appearances.SubscribeTo(*fixture.bus);

  auto cascade = fixture.bus->Subscribe<CharacterCreatedEvent>([&](const CharacterCreatedEvent& event) {
    fixture.bus->Publish(CharacterAppearanceEvent{.character_id = event.character.id, .chapter_number = 1});
  });

  auto done = fixture.bus->PublishAsync(CharacterCreatedEvent{.character = Character{.id = "c1", .name = "Aria"}});
  REQUIRE(done->WaitFor(std::chrono::seconds(5)));

  CHECK(appearances.Size() == 1);
  CHECK(fixture.bus->IsIdle());
}

TEST_CASE("WhenIdle completes immediately on a quiet bus", "[bus]") {
  BusFixture fixture;
  CHECK(fixture.bus->IsIdle());
  CHECK(fixture.bus->WhenIdle()->WaitFor(std::chrono::seconds(5)));
}

TEST_CASE("Untyped subscriptions receive the payload variant", "[bus]") {
  BusFixture fixture;
  std::atomic<int> calls{0};
  std::string seen_id;

  auto handle = fixture.bus->Subscribe("character.state_changed", [&](const EventPayload& payload) {
    seen_id = std::get<CharacterStateChangedEvent>(payload).character_id;
    ++calls;
  });

  fixture.bus->Publish(CharacterStateChangedEvent{.character_id = "c9"});
  fixture.bus->Publish(CharacterDeletedEvent{.character_id = "other"});
  fixture.Settle();

  CHECK(calls == 1);
  CHECK(seen_id == "c9");
}

TEST_CASE("Handles outliving the bus unsubscribe safely", "[bus]") {
  EventHandle handle;
  {
    BusFixture fixture;
    handle = fixture.bus->Subscribe<CharacterDeletedEvent>([](const CharacterDeletedEvent&) {});
    CHECK(handle.IsActive());
  }
  CHECK_FALSE(handle.IsActive());
  handle.Unsubscribe();
}
