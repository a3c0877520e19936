#include <set>
#include <thread>
#include <vector>

#include "PendingRegistry.hpp"
#include "TestSupport.hpp"

using namespace courier::core;
using courier::test::TempDir;
using courier::test::WriteFile;

static FileAnnouncement Announce(std::int64_t message_id, std::string filename) {
    FileAnnouncement a;
    a.sender_id = 1;
    a.chat_id = 2;
    a.message_id = message_id;
    a.token = MakeToken(a.chat_id, a.message_id);
    a.filename = std::move(filename);
    a.size = 100;
    a.handle = {"file-" + std::to_string(message_id), "u" + std::to_string(message_id)};
    return a;
}

int main() {
    TempDir dir;
    PendingRegistry registry(dir.path());

    // Create & duplicate
    auto created = registry.Create(Announce(10, "movie.mkv"));
    COURIER_CHECK(created.has_value());
    COURIER_CHECK(created->token() == "2:10");
    COURIER_CHECK(created->status == Status::AwaitingConfirmation);
    COURIER_CHECK(created->destination == dir.path() / "movie.mkv");
    COURIER_CHECK(created->cancel && !created->cancel->load());

    auto dup = registry.Create(Announce(10, "other.bin"));
    COURIER_CHECK(!dup.has_value());
    COURIER_CHECK(dup.error() == RegistryError::AlreadyExists);
    COURIER_CHECK(registry.Size() == 1);

    // A second live entry with the same name gets a reserved, adjusted destination.
    auto second = registry.Create(Announce(11, "movie.mkv"));
    COURIER_CHECK(second.has_value());
    COURIER_CHECK(second->destination == dir.path() / "movie (1).mkv");

    // Existing files on disk are avoided as well.
    WriteFile(dir.path() / "doc.pdf", "x");
    auto third = registry.Create(Announce(12, "doc.pdf"));
    COURIER_CHECK(third->destination == dir.path() / "doc (1).pdf");

    // Unusable names fall back to file_<message_id>.
    auto unnamed = registry.Create(Announce(13, ""));
    COURIER_CHECK(unnamed->destination == dir.path() / "file_13");

    // Activation happens once.
    auto active = registry.TryActivate("2:10");
    COURIER_CHECK(active.has_value());
    COURIER_CHECK(active->status == Status::InProgress);
    COURIER_CHECK(active->started_at.has_value());
    auto again = registry.TryActivate("2:10");
    COURIER_CHECK(!again && again.error() == RegistryError::AlreadyActive);
    auto missing = registry.TryActivate("2:999");
    COURIER_CHECK(!missing && missing.error() == RegistryError::NotFound);

    // In-progress entries cannot be declined.
    auto refused = registry.Decline("2:10");
    COURIER_CHECK(!refused && refused.error() == RegistryError::NotFound);

    // Decline removes.
    auto declined = registry.Decline("2:11");
    COURIER_CHECK(declined && declined->status == Status::Declined);
    COURIER_CHECK(!registry.Get("2:11"));
    COURIER_CHECK(!registry.PendingSince("2:11"));

    // Prompt & progress bookkeeping
    COURIER_CHECK(registry.AttachPrompt("2:10", 555));
    COURIER_CHECK(!registry.AttachPrompt("2:999", 1));
    registry.RecordProgress("2:10", 42);
    auto snapshot = registry.Get("2:10");
    COURIER_CHECK(snapshot->prompt_message_id == 555);
    COURIER_CHECK(snapshot->bytes_transferred == 42);

    // Cancellation only reaches in-progress entries.
    COURIER_CHECK(!registry.Cancel("2:12"));
    COURIER_CHECK(registry.CancelAll() == 1);
    COURIER_CHECK(registry.CancelAll() == 0);
    COURIER_CHECK(registry.Get("2:10")->cancel->load());

    // Listing is ordered by creation.
    auto list = registry.List();
    COURIER_CHECK(list.size() == 3);
    for (std::size_t i = 1; i < list.size(); ++i) {
        COURIER_CHECK(list[i - 1].created_at <= list[i].created_at);
    }

    // Resolve removes and is idempotent.
    auto resolved = registry.Resolve("2:10", OutcomeKind::Success);
    COURIER_CHECK(resolved && resolved->status == Status::Completed);
    COURIER_CHECK(!registry.Resolve("2:10", OutcomeKind::Success));
    auto failed = registry.Resolve("2:12", OutcomeKind::Failed);
    COURIER_CHECK(failed && failed->status == Status::Failed);
    COURIER_CHECK(registry.Size() == 1);

    // A cancelled entry leaves with the state it was in, not as a failure.
    COURIER_CHECK(registry.Create(Announce(13, "stop.bin")).has_value());
    COURIER_CHECK(registry.TryActivate("2:13").has_value());
    auto cancelled = registry.Resolve("2:13", OutcomeKind::Cancelled);
    COURIER_CHECK(cancelled && cancelled->status == Status::InProgress);
    COURIER_CHECK(registry.Size() == 1);

    // Racing activations on one token: exactly one wins.
    COURIER_CHECK(registry.Create(Announce(20, "race.bin")).has_value());
    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            if (registry.TryActivate("2:20")) {
                ++winners;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    COURIER_CHECK(winners == 1);

    // Racing creates of one token: exactly one entry.
    std::atomic<int> creates{0};
    threads.clear();
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            if (registry.Create(Announce(30, "same.bin"))) {
                ++creates;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    COURIER_CHECK(creates == 1);
    return 0;
}
