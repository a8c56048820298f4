#include <ojcases/format/percent_tokens.hpp>

#include <ojcases/common/error_types.hpp>
#include <ojcases/logging.hpp>

#include <libassert/assert.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace ojcases {

std::string PercentToken::text() const {
    if (is_placeholder()) {
        return {'%', value};
    }
    return {value};
}

PercentToken PercentTokenView::Iterator::operator*() const {
    DEBUG_ASSERT(pos_ < str_.size(), "dereferenced past the end of a format string");

    if (str_[pos_] == '%') {
        return {.kind = PercentToken::Kind::Placeholder, .value = str_[pos_ + 1]};
    }
    return {.kind = PercentToken::Kind::Literal, .value = str_[pos_]};
}

PercentTokenView::Iterator& PercentTokenView::Iterator::operator++() {
    pos_ += width();
    return *this;
}

PercentTokenView::Iterator PercentTokenView::Iterator::operator++(int) {
    Iterator prev = *this;
    ++*this;
    return prev;
}

Result<PercentTokenView> tokenize_percent(std::string_view format) {
    std::size_t pos = 0;

    while (pos < format.size()) {
        if (format[pos] != '%') {
            ++pos;
            continue;
        }

        if (pos + 1 == format.size()) {
            LOG_DEBUG("Format string {:?} ends in a lone '%'", format);
            return make_error(ErrorKind::MalformedFormat, std::string{format});
        }

        pos += 2;
    }

    return PercentTokenView{format};
}

} // namespace ojcases
