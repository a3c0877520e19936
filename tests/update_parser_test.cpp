#include <variant>

#include "TestSupport.hpp"
#include "UpdateParser.hpp"

using namespace courier::core;
using courier::network::ParseUpdate;
using courier::network::UpdateId;
namespace json = boost::json;

static json::object Parse(const char* text) { return json::parse(text).as_object(); }

int main() {
    // Document
    {
        auto update = Parse(R"({"update_id": 901, "message": {"message_id": 10,
            "from": {"id": 42, "first_name": "Ann"}, "chat": {"id": -100},
            "document": {"file_id": "F1", "file_unique_id": "U1", "file_name": "movie.mkv",
                         "file_size": 5000000000}}})");
        COURIER_CHECK(UpdateId(update) == 901);
        auto event = ParseUpdate(update);
        COURIER_CHECK(event.has_value());
        auto* file = std::get_if<FileAnnouncement>(&*event);
        COURIER_CHECK(file != nullptr);
        COURIER_CHECK(file->token == "-100:10");
        COURIER_CHECK(file->sender_id == 42 && file->chat_id == -100 && file->message_id == 10);
        COURIER_CHECK(file->filename == "movie.mkv");
        COURIER_CHECK(file->size == 5000000000ULL);
        COURIER_CHECK(file->handle.file_id == "F1" && file->handle.file_unique_id == "U1");
    }

    // Unnamed video and audio get generated names.
    {
        auto video = ParseUpdate(Parse(R"({"update_id": 1, "message": {"message_id": 5,
            "from": {"id": 1}, "chat": {"id": 2}, "video": {"file_id": "V", "file_size": 10}}})"));
        COURIER_CHECK(std::get<FileAnnouncement>(*video).filename == "video_5.mp4");

        auto audio = ParseUpdate(Parse(R"({"update_id": 2, "message": {"message_id": 6,
            "from": {"id": 1}, "chat": {"id": 2}, "audio": {"file_id": "A"}}})"));
        COURIER_CHECK(std::get<FileAnnouncement>(*audio).filename == "audio_6");
        COURIER_CHECK(std::get<FileAnnouncement>(*audio).size == 0);
    }

    // File without file_id is dropped.
    COURIER_CHECK(!ParseUpdate(Parse(R"({"update_id": 3, "message": {"message_id": 7,
        "from": {"id": 1}, "chat": {"id": 2}, "document": {"file_name": "x"}}})")));

    // Commands
    {
        auto event = ParseUpdate(Parse(R"({"update_id": 4, "message": {"message_id": 8,
            "from": {"id": 1, "first_name": "Ann", "last_name": "Lee"}, "chat": {"id": 2},
            "text": "/Status@courier_bot  now please"}})"));
        auto& cmd = std::get<CommandMessage>(*event);
        COURIER_CHECK(cmd.command == "status");
        COURIER_CHECK(cmd.args == "now please");
        COURIER_CHECK(cmd.sender_name == "Ann Lee");

        auto bare = ParseUpdate(Parse(R"({"update_id": 5, "message": {"message_id": 9,
            "from": {"id": 1, "username": "ann"}, "chat": {"id": 2}, "text": "/help"}})"));
        COURIER_CHECK(std::get<CommandMessage>(*bare).command == "help");
        COURIER_CHECK(std::get<CommandMessage>(*bare).args.empty());
        COURIER_CHECK(std::get<CommandMessage>(*bare).sender_name == "ann");
    }

    // Plain text
    {
        auto event = ParseUpdate(Parse(R"({"update_id": 6, "message": {"message_id": 11,
            "from": {"id": 1}, "chat": {"id": 2}, "text": "hello"}})"));
        COURIER_CHECK(std::holds_alternative<TextMessage>(*event));
    }

    // Stickers and friends are ignored.
    COURIER_CHECK(!ParseUpdate(Parse(R"({"update_id": 7, "message": {"message_id": 12,
        "from": {"id": 1}, "chat": {"id": 2}, "sticker": {"file_id": "S"}}})")));
    COURIER_CHECK(!ParseUpdate(Parse(R"({"update_id": 8, "edited_message": {}})")));

    // Buttons
    {
        auto yes = ParseUpdate(Parse(R"({"update_id": 9, "callback_query": {"id": "cb1",
            "from": {"id": 42}, "data": "yes:-100:10",
            "message": {"message_id": 77, "chat": {"id": -100}}}})"));
        auto& press = std::get<ButtonPress>(*yes);
        COURIER_CHECK(press.choice == Choice::Yes);
        COURIER_CHECK(press.token == "-100:10");
        COURIER_CHECK(press.callback_id == "cb1");
        COURIER_CHECK(press.message_id == 77 && press.chat_id == -100 && press.sender_id == 42);

        auto no = ParseUpdate(Parse(R"({"update_id": 10, "callback_query": {"id": "cb2",
            "from": {"id": 42}, "data": "no:-100:10",
            "message": {"message_id": 77, "chat": {"id": -100}}}})"));
        COURIER_CHECK(std::get<ButtonPress>(*no).choice == Choice::No);

        // Malformed data
        COURIER_CHECK(!ParseUpdate(Parse(R"({"update_id": 11, "callback_query": {"id": "cb3",
            "from": {"id": 42}, "data": "maybe:-100:10",
            "message": {"message_id": 77, "chat": {"id": -100}}}})")));
        COURIER_CHECK(!ParseUpdate(Parse(R"({"update_id": 12, "callback_query": {"id": "cb4",
            "from": {"id": 42}, "data": "yes:",
            "message": {"message_id": 77, "chat": {"id": -100}}}})")));
    }
    return 0;
}
