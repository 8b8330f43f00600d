#include "tether/client/streams.h"

#include "tether/common/error.h"

namespace tether {

GeneratorInputStream::GeneratorInputStream(Generator generator)
    : generator_(std::move(generator)) {
}

const google::protobuf::Message* GeneratorInputStream::Next() {
    if (exhausted_ || !generator_) {
        return nullptr;
    }
    current_ = generator_();
    if (!current_) {
        exhausted_ = true;
    }
    return current_.get();
}

absl::StatusOr<std::unique_ptr<google::protobuf::Message>> OutputStreamBase::Next() {
    switch (state_) {
    case State::kFinished:
        return std::unique_ptr<google::protobuf::Message>();
    case State::kFailed:
        return error_;
    case State::kOpen:
        break;
    }

    auto result = Pull();
    if (!result.ok()) {
        error_ = delivered_ > 0 ? StreamError(result.status(), delivered_) : result.status();
        state_ = State::kFailed;
        Finish();
        return error_;
    }
    if (*result == nullptr) {
        state_ = State::kFinished;
        Finish();
        return std::unique_ptr<google::protobuf::Message>();
    }
    ++delivered_;
    return result;
}

void OutputStreamBase::Cancel() {
    if (state_ == State::kOpen) {
        error_ = StreamError(absl::CancelledError("stream cancelled by caller"), delivered_);
        state_ = State::kFailed;
    }
    Finish();
}

size_t OutputStreamBase::GetDeliveredCount() const {
    return delivered_;
}

void OutputStreamBase::Finish() {
    if (released_) {
        return;
    }
    released_ = true;
    Release();
}

absl::StatusOr<std::vector<std::unique_ptr<google::protobuf::Message>>> ReadAll(
    OutputStream& stream) {
    std::vector<std::unique_ptr<google::protobuf::Message>> messages;
    while (true) {
        auto next = stream.Next();
        if (!next.ok()) {
            return next.status();
        }
        if (*next == nullptr) {
            break;
        }
        messages.push_back(std::move(*next));
    }
    return messages;
}

}  // namespace tether
