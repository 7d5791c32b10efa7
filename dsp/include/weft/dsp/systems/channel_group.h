// ==============================================================================
// Layer 3: System Component - ChannelGroup
// ==============================================================================
// Ordered, fixed-length sequence of nodes owned by one component. The length
// is decided once at construction (from Multichannel::lmax) and never
// changes; setters only publish new values into the existing members.
//
// release() frees the stream of every member the group is the last owner of,
// then drops the members. A member still held elsewhere (a downstream
// component reading it, a routing list not yet collected) keeps its stream
// and lives on with its last owner. Components release their groups
// downstream-first (output members, then voices, then input faders).
// ==============================================================================

#pragma once

#include "weft/dsp/core/dsp_errors.h"

#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

namespace Weft {
namespace DSP {

template <typename T>
class ChannelGroup {
public:
    ChannelGroup() = default;

    /// @param count Number of members (> 0)
    /// @param make Factory called as make(i), returning std::shared_ptr<T>
    /// @throws ConfigurationError if count is zero
    template <typename Factory>
    ChannelGroup(size_t count, Factory&& make) {
        if (count == 0) {
            throw ConfigurationError("channel group needs at least one member");
        }
        members_.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            members_.push_back(make(i));
        }
    }

    ~ChannelGroup() { release(); }

    ChannelGroup(const ChannelGroup&) = delete;
    ChannelGroup& operator=(const ChannelGroup&) = delete;

    ChannelGroup(ChannelGroup&& other) noexcept : members_(std::move(other.members_)) {}
    ChannelGroup& operator=(ChannelGroup&& other) noexcept {
        if (this != &other) {
            release();
            members_ = std::move(other.members_);
        }
        return *this;
    }

    [[nodiscard]] size_t size() const noexcept { return members_.size(); }
    [[nodiscard]] bool empty() const noexcept { return members_.empty(); }

    [[nodiscard]] T& operator[](size_t i) const noexcept { return *members_[i]; }
    [[nodiscard]] const std::shared_ptr<T>& node(size_t i) const noexcept { return members_[i]; }

    [[nodiscard]] auto begin() const noexcept { return members_.begin(); }
    [[nodiscard]] auto end() const noexcept { return members_.end(); }

    /// @brief Release the streams of members nobody else holds, then drop
    /// the members. Call only between blocks.
    void release() noexcept {
        for (auto& member : members_) {
            if (member && member.use_count() == 1) member->releaseStream();
        }
        members_.clear();
    }

private:
    std::vector<std::shared_ptr<T>> members_;
};

} // namespace DSP
} // namespace Weft
