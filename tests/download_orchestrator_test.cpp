#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>

#include "DownloadOrchestrator.hpp"
#include "TransferPool.hpp"
#include "TestSupport.hpp"

using namespace courier::core;
using courier::infra::TransferPool;
using courier::test::FakeFetcher;
using courier::test::FakeTransport;
using courier::test::ReadFile;
using courier::test::Run;
using courier::test::RunUntil;
using courier::test::TempDir;
namespace asio = boost::asio;

namespace {

constexpr std::int64_t OPERATOR = 42;
constexpr std::int64_t CHAT = -100;

FileAnnouncement Announce(std::int64_t message_id, std::string filename, std::uint64_t size,
                          std::int64_t sender = OPERATOR, std::int64_t chat = CHAT) {
    FileAnnouncement a;
    a.sender_id = sender;
    a.chat_id = chat;
    a.message_id = message_id;
    a.token = MakeToken(chat, message_id);
    a.filename = std::move(filename);
    a.size = size;
    a.handle = {"F" + std::to_string(message_id), "U" + std::to_string(message_id)};
    return a;
}

ButtonPress Press(const Token& token, Choice choice, std::int64_t sender = OPERATOR,
                  std::int64_t chat = CHAT) {
    static int next_callback = 0;
    ButtonPress p;
    p.sender_id = sender;
    p.chat_id = chat;
    p.message_id = 1000;
    p.callback_id = "cb" + std::to_string(++next_callback);
    p.token = token;
    p.choice = choice;
    return p;
}

struct Fixture {
    explicit Fixture(OrchestratorOptions options = {}) {
        RunnerOptions runner_options;
        runner_options.max_attempts = 3;
        runner_options.retry_backoff = std::chrono::milliseconds(2);
        // Only the final 100% report gets through.
        runner_options.progress_interval = std::chrono::hours(1);

        registry = std::make_shared<PendingRegistry>(dir.path());
        fetcher = std::make_shared<FakeFetcher>();
        transport = std::make_shared<FakeTransport>();
        runner = std::make_shared<TransferRunner>(pool, fetcher, runner_options);
        orchestrator = std::make_shared<DownloadOrchestrator>(ioc.get_executor(), AccessGuard(OPERATOR, CHAT),
                                                              registry, runner, transport, options);
        pool.Start();
    }

    ~Fixture() {
        fetcher->hold = false;
        orchestrator->Stop();
        pool.Stop();
    }

    void Announce(FileAnnouncement a) { Run(ioc, orchestrator->OnAnnouncement(std::move(a))); }
    void Press(ButtonPress p) { Run(ioc, orchestrator->OnButtonPress(std::move(p))); }

    // Lets runner callbacks that are already queued run to completion.
    void Settle() {
        RunUntil(ioc, [] { return false; }, std::chrono::milliseconds(50));
    }

    asio::io_context ioc;
    TransferPool pool{2};
    TempDir dir;
    std::shared_ptr<PendingRegistry> registry;
    std::shared_ptr<FakeFetcher> fetcher;
    std::shared_ptr<FakeTransport> transport;
    std::shared_ptr<TransferRunner> runner;
    std::shared_ptr<DownloadOrchestrator> orchestrator;
};

}  // namespace

int main() {
    // Announcement from the operator produces one confirmation prompt.
    {
        Fixture f;
        f.Announce(Announce(10, "movie.mkv", 5'000'000'000ULL));

        COURIER_CHECK(f.transport->sent.size() == 1);
        const auto& prompt = f.transport->sent.front();
        COURIER_CHECK(prompt.chat_id == CHAT);
        COURIER_CHECK(prompt.reply_to == 10);
        COURIER_CHECK(prompt.text.find("Are you sure you want to download the file?") != std::string::npos);
        COURIER_CHECK(prompt.keyboard && (*prompt.keyboard)[0][0].callback_data == "yes:-100:10");

        auto entry = f.registry->Get("-100:10");
        COURIER_CHECK(entry && entry->status == Status::AwaitingConfirmation);
        COURIER_CHECK(entry->prompt_message_id == prompt.message_id);

        // Redelivery of the same message does not create a second entry or prompt.
        f.Announce(Announce(10, "movie.mkv", 5'000'000'000ULL));
        COURIER_CHECK(f.registry->Size() == 1);
        COURIER_CHECK(f.transport->sent.size() == 1);

        // "No" declines: entry gone, prompt edited, nothing on disk.
        f.Press(Press("-100:10", Choice::No));
        COURIER_CHECK(!f.registry->Get("-100:10"));
        COURIER_CHECK(f.transport->edits.size() == 1);
        COURIER_CHECK(f.transport->edits.front().message_id == prompt.message_id);
        COURIER_CHECK(f.transport->EditsContaining("Declined") == 1);
        COURIER_CHECK(f.transport->acks.size() == 1);
        COURIER_CHECK(f.dir.FileCount() == 0);
        COURIER_CHECK(f.fetcher->calls == 0);
    }

    // Two "Yes" presses before the first is handled: one transfer, one notification.
    {
        Fixture f;
        const auto size = f.fetcher->content.size();
        f.Announce(Announce(11, "report.pdf", size));

        bool first_done = false;
        bool second_done = false;
        asio::co_spawn(f.ioc, f.orchestrator->OnButtonPress(Press("-100:11", Choice::Yes)),
                       [&](std::exception_ptr) { first_done = true; });
        asio::co_spawn(f.ioc, f.orchestrator->OnButtonPress(Press("-100:11", Choice::Yes)),
                       [&](std::exception_ptr) { second_done = true; });

        COURIER_CHECK(RunUntil(f.ioc, [&] {
            return first_done && second_done &&
                   f.transport->SentContaining("File downloaded successfully.") == 1;
        }));
        f.Settle();

        COURIER_CHECK(f.transport->EditsContaining("Downloading… 0%") == 1);
        COURIER_CHECK(f.transport->SentContaining("File downloaded successfully.") == 1);
        COURIER_CHECK(f.fetcher->calls == 1);
        COURIER_CHECK(f.registry->Size() == 0);
        COURIER_CHECK(f.orchestrator->active_transfers() == 0);
        COURIER_CHECK(ReadFile(f.dir.path() / "report.pdf") == f.fetcher->content);
        COURIER_CHECK(f.dir.FileCount() == 1);

        // The notification answers the file message; the prompt shows the final state.
        const auto& note = f.transport->sent.back();
        COURIER_CHECK(note.reply_to == 11);
        COURIER_CHECK(f.transport->edits.back().text.find("Downloaded") != std::string::npos);
    }

    // A slow progress edit cannot land after the closing one.
    {
        Fixture f;
        f.transport->edit_delay = [](const std::string& text) {
            return text.find("Downloading") != std::string::npos ? std::chrono::milliseconds(100)
                                                                  : std::chrono::milliseconds(0);
        };
        f.Announce(Announce(16, "slow.bin", f.fetcher->content.size()));
        const auto prompt_id = f.transport->sent.front().message_id;
        f.Press(Press("-100:16", Choice::Yes));

        COURIER_CHECK(RunUntil(f.ioc, [&] {
            return f.transport->SentContaining("File downloaded successfully.") == 1 &&
                   f.transport->EditsContaining("Downloaded") == 1;
        }));
        RunUntil(f.ioc, [] { return false; }, std::chrono::milliseconds(300));

        auto texts = f.transport->EditsOf(prompt_id);
        COURIER_CHECK(texts.size() >= 2);
        COURIER_CHECK(texts.back().find("Downloaded") != std::string::npos);
        COURIER_CHECK(f.transport->EditsContaining("Downloaded") == 1);
    }

    // A queued prompt shows "Queued" before it shows the download starting.
    {
        OrchestratorOptions options;
        options.max_concurrent = 1;
        Fixture f(options);
        f.transport->edit_delay = [](const std::string& text) {
            return text.find("Queued") != std::string::npos ? std::chrono::milliseconds(300)
                                                             : std::chrono::milliseconds(0);
        };
        f.fetcher->hold = true;
        f.Announce(Announce(17, "first.bin", 16));
        f.Announce(Announce(18, "second.bin", 16));
        const auto second_prompt = f.transport->sent[1].message_id;

        f.Press(Press("-100:17", Choice::Yes));
        asio::co_spawn(f.ioc, f.orchestrator->OnButtonPress(Press("-100:18", Choice::Yes)), asio::detached);
        COURIER_CHECK(RunUntil(f.ioc, [&] { return f.orchestrator->queued_transfers() == 1; }));

        // The slot frees while the "Queued" edit is still on its way.
        f.fetcher->hold = false;
        COURIER_CHECK(RunUntil(f.ioc, [&] {
            return f.transport->SentContaining("File downloaded successfully.") == 2 &&
                   f.transport->EditsContaining("Downloaded") == 2;
        }));
        f.Settle();

        auto texts = f.transport->EditsOf(second_prompt);
        COURIER_CHECK(!texts.empty());
        COURIER_CHECK(texts.front().find("Queued") != std::string::npos);
        COURIER_CHECK(texts.back().find("Downloaded") != std::string::npos);
    }

    // Retries exhausted: failure notification, entry removed.
    {
        Fixture f;
        f.fetcher->transient_failures = 100;
        f.Announce(Announce(12, "movie.mkv", 16));
        f.Press(Press("-100:12", Choice::Yes));

        COURIER_CHECK(RunUntil(f.ioc, [&] { return f.transport->SentContaining("Error downloading file.") == 1; }));
        COURIER_CHECK(f.transport->SentContaining("network reset") == 1);
        COURIER_CHECK(!f.registry->Get("-100:12"));
        COURIER_CHECK(f.transport->EditsContaining("Failed") == 1);
        COURIER_CHECK(f.fetcher->calls == 3);
        COURIER_CHECK(RunUntil(f.ioc, [&] { return f.dir.FileCount() == 0; }));
    }

    // Unknown token: silent.
    {
        Fixture f;
        f.Press(Press("-100:9", Choice::Yes));
        f.Press(Press("-100:9", Choice::No));
        COURIER_CHECK(f.transport->sent.empty());
        COURIER_CHECK(f.transport->edits.empty());
        COURIER_CHECK(f.fetcher->calls == 0);
    }

    // Unauthorized sender or chat: nothing at all.
    {
        Fixture f;
        f.Announce(Announce(13, "evil.sh", 10, 666, CHAT));
        f.Announce(Announce(14, "evil.sh", 10, OPERATOR, 777));
        COURIER_CHECK(f.registry->Size() == 0);
        COURIER_CHECK(f.transport->OutboundCount() == 0);

        f.Announce(Announce(15, "ok.bin", 10));
        f.Press(Press("-100:15", Choice::Yes, 666));
        COURIER_CHECK(f.transport->acks.empty());
        COURIER_CHECK(f.registry->Get("-100:15")->status == Status::AwaitingConfirmation);
    }

    // Beyond max_concurrent, confirmations queue and start in order.
    {
        OrchestratorOptions options;
        options.max_concurrent = 1;
        Fixture f(options);
        f.fetcher->hold = true;

        f.Announce(Announce(20, "a.bin", 16));
        f.Announce(Announce(21, "b.bin", 16));
        f.Announce(Announce(22, "c.bin", 16));

        f.Press(Press("-100:20", Choice::Yes));
        COURIER_CHECK(f.orchestrator->active_transfers() == 1);

        f.Press(Press("-100:21", Choice::Yes));
        f.Press(Press("-100:21", Choice::Yes));
        COURIER_CHECK(f.orchestrator->queued_transfers() == 1);
        COURIER_CHECK(f.transport->EditsContaining("Queued") == 1);
        COURIER_CHECK(f.registry->Get("-100:21")->status == Status::AwaitingConfirmation);

        // "No" on a queued entry declines it.
        f.Press(Press("-100:22", Choice::Yes));
        COURIER_CHECK(f.orchestrator->queued_transfers() == 2);
        f.Press(Press("-100:22", Choice::No));
        COURIER_CHECK(f.orchestrator->queued_transfers() == 1);
        COURIER_CHECK(!f.registry->Get("-100:22"));

        f.fetcher->hold = false;
        COURIER_CHECK(RunUntil(f.ioc, [&] {
            return f.transport->SentContaining("File downloaded successfully.") == 2;
        }));
        COURIER_CHECK(f.fetcher->calls == 2);
        COURIER_CHECK(f.orchestrator->queued_transfers() == 0);
        COURIER_CHECK(f.registry->Size() == 0);
        COURIER_CHECK(std::filesystem::exists(f.dir.path() / "a.bin"));
        COURIER_CHECK(std::filesystem::exists(f.dir.path() / "b.bin"));
        COURIER_CHECK(!std::filesystem::exists(f.dir.path() / "c.bin"));
    }

    // Cancelling a running transfer leaves nothing behind.
    {
        Fixture f;
        f.fetcher->hold = true;
        f.Announce(Announce(30, "big.iso", 16));
        f.Press(Press("-100:30", Choice::Yes));
        COURIER_CHECK(RunUntil(f.ioc, [&] { return f.fetcher->calls == 1; }));

        COURIER_CHECK(f.orchestrator->CancelAll() == 1);
        COURIER_CHECK(RunUntil(f.ioc, [&] { return f.transport->SentContaining("Download cancelled.") == 1; }));
        COURIER_CHECK(f.registry->Size() == 0);
        COURIER_CHECK(RunUntil(f.ioc, [&] { return f.dir.FileCount() == 0; }));
        COURIER_CHECK(f.orchestrator->CancelAll() == 0);
    }

    // Confirmation timeout sweep.
    {
        OrchestratorOptions options;
        options.confirmation_timeout = std::chrono::seconds(60);
        Fixture f(options);
        f.Announce(Announce(40, "late.bin", 16));

        auto now = std::chrono::system_clock::now();
        COURIER_CHECK(Run(f.ioc, f.orchestrator->SweepExpired(now)) == 0);
        COURIER_CHECK(f.registry->Size() == 1);

        COURIER_CHECK(Run(f.ioc, f.orchestrator->SweepExpired(now + std::chrono::seconds(61))) == 1);
        COURIER_CHECK(f.registry->Size() == 0);
        COURIER_CHECK(f.transport->EditsContaining("Expired") == 1);

        // A late "Yes" on the expired prompt is a no-op.
        f.Press(Press("-100:40", Choice::Yes));
        COURIER_CHECK(f.fetcher->calls == 0);
    }

    // Without a timeout the sweep never declines anything.
    {
        Fixture f;
        f.Announce(Announce(41, "keep.bin", 16));
        auto later = std::chrono::system_clock::now() + std::chrono::hours(24);
        COURIER_CHECK(Run(f.ioc, f.orchestrator->SweepExpired(later)) == 0);
        COURIER_CHECK(f.registry->Size() == 1);
    }

    // A prompt that cannot be delivered does not leave an orphan entry.
    {
        Fixture f;
        f.transport->fail_sends = true;
        f.Announce(Announce(50, "lost.bin", 16));
        COURIER_CHECK(f.registry->Size() == 0);
    }
    return 0;
}
