#pragma once

#include <memory>
#include <string>
#include <vector>
#include <optional>
#include <functional>

#include "../src/destination/destination.hpp"
#include "../src/source/fragment_source.hpp"

#define STRING(x) #x
#define XSTRING(x) STRING(x)

#define APP_NAME XSTRING(CMAKE_PROJECT_NAME)

std::string get_tmp_dir();

// deterministic payload of the given size
std::string make_payload(size_t size);

// splits a payload into fragments of nearly equal size followed by stream end
std::vector<stream_event_t> split_payload(const std::string &payload, size_t fragments);

// Replays a scripted stream. before_next is called with the index of the
// event about to be returned.
class FakeFragmentSource : public FragmentSource {
  public:
    FakeFragmentSource(
        std::vector<stream_event_t> script_,
        std::optional<unsigned long long> declared_ = std::nullopt,
        std::function<void(size_t)> before_next_ = nullptr
    );

    stream_event_t next() override;
    std::optional<unsigned long long> declared_length() const override;

  private:
    std::vector<stream_event_t> script;
    std::optional<unsigned long long> declared;
    std::function<void(size_t)> before_next;
    size_t position;
};

fragment_source_factory_t fake_source_factory(
    std::vector<stream_event_t> script,
    std::optional<unsigned long long> declared = std::nullopt,
    std::function<void(size_t)> before_next = nullptr
);

struct transfer_call_t {
    unsigned long long offset;
    size_t size;
};

// what a ScriptedDestination saw, shared with the test after the
// destination itself is destroyed
struct destination_log_t {
    unsigned int starts = 0;
    unsigned long long declared_length = 0;
    std::vector<transfer_call_t> transfers;
    std::string received;
    std::vector<bool> finish_with_thumbnail;
    unsigned int abandons = 0;
};

struct destination_script_t {
    bool fail_start = false;
    // index of the transfer call that fails
    std::optional<size_t> fail_transfer_call;
    bool fail_finish = false;
    // a finish carrying a thumbnail fails as a secondary artifact failure
    bool reject_thumbnail = false;
};

class ScriptedDestination : public UploadDestination {
  public:
    ScriptedDestination(const std::string &id_, destination_script_t script_, std::shared_ptr<destination_log_t> log_);

    const std::string &get_id() const override;
    std::variant<upload_session_t, std::string> start(unsigned long long total_length, const upload_metadata_t &metadata) override;
    std::optional<std::string> transfer(const upload_session_t &session, unsigned long long offset, std::string_view chunk) override;
    std::variant<remote_artifact_t, finish_error_t> finish(const upload_session_t &session, const upload_metadata_t &metadata) override;
    void abandon(const upload_session_t &session) override;

  private:
    const std::string id;
    destination_script_t script;
    std::shared_ptr<destination_log_t> log;
};
