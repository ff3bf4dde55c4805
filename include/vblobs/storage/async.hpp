#pragma once

#include <functional>
#include <future>
#include <memory>
#include <utility>
#include "vblobs/storage/storage_provider.hpp"

namespace vblobs {
namespace storage {

// 在后台线程执行一次存储操作, 返回该操作结果的future。
// 参数按值复制进任务; provider由shared_ptr持有, 保证任务结束前不被释放。
// 不同操作之间不做任何同步, 对同一路径的并发操作由调用方自行串行化。
//
//   auto future = RunAsync(provider, &StorageProvider::CreateFolder, std::string("a/b"));
//   Error err = future.get();
template<typename Provider, typename Method, typename... Args>
auto RunAsync(std::shared_ptr<Provider> provider, Method method, Args... args)
    -> std::future<decltype((std::declval<Provider&>().*method)(args...))> {
    return std::async(std::launch::async,
        [provider = std::move(provider), method, args...]() mutable {
            return std::invoke(method, *provider, args...);
        });
}

} // namespace storage
} // namespace vblobs
