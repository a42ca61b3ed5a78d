#pragma once

#include <concepts>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

using MutDataBlock = std::span<std::byte>;
using ConstDataBlock = std::span<const std::byte>;

namespace util {

template<typename T>
concept ProtobufMessage = requires(T msg, void* ptr, int size) {
    { msg.ByteSizeLong() } -> std::same_as<size_t>;
    { msg.SerializeToArray(ptr, size) } -> std::same_as<bool>;
    { msg.ParseFromArray(ptr, size) } -> std::same_as<bool>;
};

inline ConstDataBlock as_block(std::string_view bytes) {
    return {reinterpret_cast<const std::byte*>(bytes.data()), bytes.size()};
}

inline std::string_view as_string_view(ConstDataBlock data) {
    return {reinterpret_cast<const char*>(data.data()), data.size()};
}

template<ProtobufMessage T>
ConstDataBlock serialize(const T& message, std::vector<std::byte>& buffer) {
    const size_t size = message.ByteSizeLong();
    if (buffer.size() < size) {
        buffer.resize(size);
    }

    if (!message.SerializeToArray(buffer.data(), static_cast<int>(size))) {
        return {};
    }

    return ConstDataBlock(buffer.data(), size);
}

// Empty input is a valid encoding of a message with every field at its default.
template<ProtobufMessage T>
bool deserialize(ConstDataBlock data, T& message) {
    return message.ParseFromArray(data.data(), static_cast<int>(data.size()));
}

template<ProtobufMessage T>
std::optional<T> deserialize(ConstDataBlock data) {
    T message;
    if (!deserialize(data, message)) {
        return std::nullopt;
    }
    return message;
}

} // namespace util
