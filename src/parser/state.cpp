#include <annodoc/parser/state.hpp>

#include <algorithm>

namespace annodoc::parser {

ParserState::ParserState() : lines_(std::make_shared<const std::vector<std::string>>()) {}

ParserState::ParserState(std::vector<std::string> lines)
    : lines_(std::make_shared<const std::vector<std::string>>(std::move(lines))) {}

ParserState::ParserState(std::shared_ptr<const std::vector<std::string>> lines,
                         std::size_t position, ParseContext context)
    : lines_(lines ? std::move(lines) : std::make_shared<const std::vector<std::string>>()),
      position_(std::clamp<std::size_t>(position, 1, lines_->size() + 1)),
      context_(std::move(context)) {}

auto ParserState::peek(std::size_t offset) const -> Maybe<std::string_view> {
    const std::size_t index = position_ - 1 + offset;
    if (index >= lines_->size()) {
        return nothing;
    }
    return just(std::string_view((*lines_)[index]));
}

auto ParserState::advance(std::size_t steps) const -> ParserState {
    const std::size_t end = lines_->size() + 1;
    const std::size_t next = steps >= end - position_ ? end : position_ + steps;
    return ParserState(lines_, next, context_);
}

auto ParserState::with_context(ParseContext context) const -> ParserState {
    return ParserState(lines_, position_, std::move(context));
}

auto ParserState::operator==(const ParserState& other) const -> bool {
    return position_ == other.position_ && context_ == other.context_ &&
           (lines_ == other.lines_ || *lines_ == *other.lines_);
}

}  // namespace annodoc::parser
