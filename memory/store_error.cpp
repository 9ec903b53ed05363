#include "store_error.hpp"
#include <utility>

namespace {

std::string describe(const std::exception_ptr& cause) {
    if (!cause) {
        return "Stream destroyed!";
    }
    try {
        std::rethrow_exception(cause);
    } catch (const std::exception& e) {
        return std::string("Stream destroyed: ") + e.what();
    } catch (...) {
        // 非 std::exception 的原因仍保存在 cause_ 中，这里只缺少描述文字
        return "Stream destroyed: non-standard exception";
    }
}

} // namespace

StoreDestroyedError::StoreDestroyedError(std::exception_ptr cause)
    : StoreError(describe(cause))
    , cause_(std::move(cause)) {}
