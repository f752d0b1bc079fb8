#include <catch2/catch_test_macros.hpp>

#include "base64.hpp"
#include "fake_engine.hpp"
#include "request_handler.hpp"
#include "wav_fixture.hpp"

#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using json = nlohmann::json;

namespace {

json payload(const std::vector<uint8_t>& audio, const std::string& format = "wav",
             const std::string& language = "auto") {
    return {
        {"filename", "clip." + format},
        {"data", base64::encode(audio)},
        {"format", format},
        {"language", language},
    };
}

struct HandlerFixture {
    HealthReporter health{"fake-base"};
    RequestHandler handler;
    FakeEngine* engine = nullptr;

    explicit HandlerFixture(std::vector<std::string> languages = {}, size_t depth = 4)
        : handler(health, std::move(languages)) {
        auto owned = std::make_unique<FakeEngine>();
        engine = owned.get();
        handler.attach(std::make_unique<JobQueue>(std::move(owned), JobQueue::Options{.max_depth = depth}));
    }
};

} // namespace

TEST_CASE("RequestHandler", "[handler]") {

    SECTION("EmptyWavIsEmptyInput") {
        HandlerFixture f;
        auto reply = f.handler.transcribe(payload({}, "wav"));
        REQUIRE(reply.status == 400);
        REQUIRE(reply.body["ok"] == false);
        REQUIRE(reply.body["errorKind"] == "EmptyInput");
        REQUIRE(f.engine->calls().empty());
    }

    SECTION("OggIsUnsupportedFormat") {
        HandlerFixture f;
        auto reply = f.handler.transcribe(payload(wav::silent_clip(1.0), "ogg"));
        REQUIRE(reply.status == 400);
        REQUIRE(reply.body["ok"] == false);
        REQUIRE(reply.body["errorKind"] == "UnsupportedFormat");
    }

    SECTION("SilentClipIsOkWithEmptyText") {
        HandlerFixture f;
        auto reply = f.handler.transcribe(payload(wav::silent_clip(2.0)));
        REQUIRE(reply.status == 200);
        REQUIRE(reply.body["ok"] == true);
        REQUIRE(reply.body["text"] == "");
    }

    SECTION("SpokenClipWithAutoLanguage") {
        HandlerFixture f;
        auto reply = f.handler.transcribe(payload(wav::tone_clip(1.5), "wav", "auto"));
        REQUIRE(reply.status == 200);
        REQUIRE(reply.body["ok"] == true);
        REQUIRE_FALSE(reply.body["text"].get<std::string>().empty());
        REQUIRE(reply.body["language"] == "en");
    }

    SECTION("SameAudioTwiceSucceedsTwice") {
        HandlerFixture f;
        auto p = payload(wav::tone_clip(0.5));
        REQUIRE(f.handler.transcribe(p).body["ok"] == true);
        REQUIRE(f.handler.transcribe(p).body["ok"] == true);
        REQUIRE(f.engine->calls().size() == 2);
    }

    SECTION("DefaultsForOptionalFields") {
        HandlerFixture f;
        json p = {{"data", base64::encode(wav::tone_clip(0.5))}};
        auto request = f.handler.parse(p);
        REQUIRE(request.has_value());
        REQUIRE(request->filename == "audio");
        REQUIRE(request->format == AudioFormat::Wav);
        REQUIRE(request->language == "auto");

        auto reply = f.handler.transcribe(p);
        REQUIRE(reply.body["ok"] == true);
        REQUIRE(f.engine->languages() == std::vector<std::string>{"auto"});
    }

    SECTION("ExplicitLanguageReachesModel") {
        HandlerFixture f;
        auto reply = f.handler.transcribe(payload(wav::tone_clip(0.5), "wav", "es"));
        REQUIRE(reply.body["ok"] == true);
        REQUIRE(reply.body["language"] == "es");
        REQUIRE(f.engine->languages() == std::vector<std::string>{"es"});
    }

    SECTION("LanguageUnknownToModel") {
        HandlerFixture f;
        auto reply = f.handler.transcribe(payload(wav::tone_clip(0.5), "wav", "xx"));
        REQUIRE(reply.status == 400);
        REQUIRE(reply.body["errorKind"] == "UnsupportedLanguage");
    }

    SECTION("ConfiguredLanguageSet") {
        HandlerFixture f({"de"});
        REQUIRE(f.handler.transcribe(payload(wav::tone_clip(0.5), "wav", "de")).body["ok"] == true);
        REQUIRE(f.handler.transcribe(payload(wav::tone_clip(0.5), "wav", "auto")).body["ok"] == true);

        auto reply = f.handler.transcribe(payload(wav::tone_clip(0.5), "wav", "en"));
        REQUIRE(reply.body["errorKind"] == "UnsupportedLanguage");
    }

    SECTION("MalformedJsonBody") {
        HandlerFixture f;
        auto reply = f.handler.transcribe(std::string_view("{\"data\": "));
        REQUIRE(reply.status == 400);
        REQUIRE(reply.body["errorKind"] == "InvalidRequest");
    }

    SECTION("InvalidUtf8Body") {
        HandlerFixture f;
        auto reply = f.handler.transcribe(std::string_view("{\"data\":\"\xff\"}"));
        REQUIRE(reply.status == 400);
        REQUIRE(reply.body["errorKind"] == "InvalidRequest");
        REQUIRE_NOTHROW(reply.text());
    }

    SECTION("BodyMustBeObject") {
        HandlerFixture f;
        auto reply = f.handler.transcribe(std::string_view("[1, 2, 3]"));
        REQUIRE(reply.body["errorKind"] == "InvalidRequest");
    }

    SECTION("MissingData") {
        HandlerFixture f;
        auto reply = f.handler.transcribe(json{{"format", "wav"}});
        REQUIRE(reply.status == 400);
        REQUIRE(reply.body["errorKind"] == "InvalidRequest");
    }

    SECTION("NonStringField") {
        HandlerFixture f;
        json p = payload(wav::tone_clip(0.5));
        p["format"] = 42;
        REQUIRE(f.handler.transcribe(p).body["errorKind"] == "InvalidRequest");
    }

    SECTION("InvalidBase64") {
        HandlerFixture f;
        json p = payload(wav::tone_clip(0.5));
        p["data"] = "@@not base64@@";
        REQUIRE(f.handler.transcribe(p).body["errorKind"] == "InvalidRequest");
    }

    SECTION("CorruptAudio") {
        HandlerFixture f;
        std::vector<uint8_t> junk = {'j', 'u', 'n', 'k', 0, 1, 2, 3, 4, 5};
        auto reply = f.handler.transcribe(payload(junk, "wav"));
        REQUIRE(reply.status == 422);
        REQUIRE(reply.body["errorKind"] == "CorruptAudio");
        REQUIRE(f.engine->calls().empty());
    }

    SECTION("InferenceErrorIs500") {
        HandlerFixture f;
        f.engine->set_fail(true);
        auto reply = f.handler.transcribe(payload(wav::tone_clip(0.5)));
        REQUIRE(reply.status == 500);
        REQUIRE(reply.body["ok"] == false);
        REQUIRE(reply.body["errorKind"] == "InferenceError");
    }

    SECTION("NotReadyBeforeAttach") {
        HealthReporter health("fake-base");
        RequestHandler handler(health, {});
        auto reply = handler.transcribe(payload(wav::tone_clip(0.5)));
        REQUIRE(reply.status == 503);
        REQUIRE(reply.body["errorKind"] == "NotReady");
    }

    SECTION("BusyBeforeDecoding") {
        HandlerFixture f({}, 2);
        f.engine->close_gate();

        auto p = payload(wav::tone_clip(0.5));
        std::vector<int> statuses(2, 0);
        std::vector<std::jthread> senders;
        for (size_t i = 0; i < 2; i++) {
            senders.emplace_back([&, i] { statuses[i] = f.handler.transcribe(p).status; });
        }
        for (int i = 0; i < 500 && f.handler.in_flight() < 2; i++) {
            std::this_thread::sleep_for(10ms);
        }
        REQUIRE(f.handler.in_flight() == 2);

        // Corrupt audio would be 422 if it got as far as the decoder.
        std::vector<uint8_t> junk = {'j', 'u', 'n', 'k', 0, 1, 2, 3};
        auto reply = f.handler.transcribe(payload(junk, "wav"));
        REQUIRE(reply.status == 503);
        REQUIRE(reply.body["errorKind"] == "ServerBusy");

        f.engine->open_gate();
        senders.clear();
        REQUIRE(statuses == std::vector<int>{200, 200});
        REQUIRE(f.handler.in_flight() == 0);
    }

    SECTION("ErrorReplyShape") {
        auto reply = RequestHandler::error_reply({ErrorKind::ServerBusy, "queue is full"});
        REQUIRE(reply.status == 503);
        REQUIRE(reply.body["ok"] == false);
        REQUIRE(reply.body["errorKind"] == "ServerBusy");
        REQUIRE(reply.body["error"] == "queue is full");

        REQUIRE(RequestHandler::error_reply({ErrorKind::InferenceTimeout, ""}).status == 504);
    }
}
