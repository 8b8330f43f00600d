#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <google/protobuf/message.h>

namespace tether {

/// Lazy sequence of inputs for a stream-in call. Pulled by the protocol
/// client in order; the returned pointer stays valid until the next call.
class InputStream {
public:
    virtual ~InputStream() = default;

    // Next message, or nullptr once the sequence is exhausted.
    virtual const google::protobuf::Message* Next() = 0;

    // Non-OK when the sequence ended on a failure rather than exhaustion.
    // Consumers abandon the call and report this status instead.
    virtual absl::Status GetStatus() const {
        return absl::OkStatus();
    }
};

template <typename MessageT>
class VectorInputStream final : public InputStream {
public:
    explicit VectorInputStream(std::vector<MessageT> items)
        : items_(std::move(items)) {}

    const google::protobuf::Message* Next() override {
        if (index_ >= items_.size()) {
            return nullptr;
        }
        return &items_[index_++];
    }

private:
    std::vector<MessageT> items_;
    size_t index_ = 0;
};

/// Inputs produced on demand. The generator returns nullptr to end the
/// sequence, so unbounded inputs can be fed to transports that stream.
class GeneratorInputStream final : public InputStream {
public:
    using Generator = std::function<std::unique_ptr<google::protobuf::Message>()>;

    explicit GeneratorInputStream(Generator generator);

    const google::protobuf::Message* Next() override;

private:
    Generator generator_;
    std::unique_ptr<google::protobuf::Message> current_;
    bool exhausted_ = false;
};

/// Lazy, finite, non-restartable sequence of outputs of a stream-out call.
/// Destroying the stream before it is exhausted cancels the remote call.
class OutputStream {
public:
    virtual ~OutputStream() = default;

    // Blocks until the next message arrives. Returns nullptr once the server
    // closed the stream cleanly. After the end or an error every further call
    // returns the same result.
    virtual absl::StatusOr<std::unique_ptr<google::protobuf::Message>> Next() = 0;

    // Abandon the stream and release the underlying transport call.
    virtual void Cancel() = 0;

    virtual size_t GetDeliveredCount() const = 0;
};

/// Sticky end/error bookkeeping shared by the transport streams. Failures
/// after at least one delivered message are reported as stream errors.
class OutputStreamBase : public OutputStream {
public:
    absl::StatusOr<std::unique_ptr<google::protobuf::Message>> Next() final;
    void Cancel() final;
    size_t GetDeliveredCount() const final;

protected:
    // One message, nullptr on clean end of stream.
    virtual absl::StatusOr<std::unique_ptr<google::protobuf::Message>> Pull() = 0;

    // Release the transport call. Called at most once.
    virtual void Release() = 0;

private:
    enum class State {
        kOpen,
        kFinished,
        kFailed
    };

    void Finish();

    State state_ = State::kOpen;
    absl::Status error_;
    size_t delivered_ = 0;
    bool released_ = false;
};

// Drain |stream|. Stops at the first error.
absl::StatusOr<std::vector<std::unique_ptr<google::protobuf::Message>>> ReadAll(
    OutputStream& stream);

}  // namespace tether
