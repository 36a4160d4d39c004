#include "journal.hpp"

#include <docdelta-cpp/resolver.hpp>

#include <iterator>
#include <utility>

namespace docdelta_cpp::detail {

void Journal::insert(const Path& path, Tree value) {
    auto result = docdelta_cpp::insert(tree_, path, std::move(value));
    steps_.emplace_back(UndoInsert{std::move(result.location), std::move(result.displaced)});
}

void Journal::erase(const Path& path) {
    auto result = docdelta_cpp::erase(tree_, path);
    steps_.emplace_back(UndoErase{path, std::move(result.value), result.position});
}

void Journal::set(const Path& path, Tree value) {
    auto previous = docdelta_cpp::set(tree_, path, std::move(value));
    steps_.emplace_back(UndoSet{path, std::move(previous)});
}

void Journal::rollback() {
    for (auto it = steps_.rbegin(); it != steps_.rend(); ++it) {
        undo(*it);
    }
    steps_.clear();
}

void Journal::undo(UndoStep& step) {
    std::visit(overload{
        [&](UndoInsert& s) {
            if (s.displaced) {
                docdelta_cpp::set(tree_, s.location, std::move(*s.displaced));
            } else {
                docdelta_cpp::erase(tree_, s.location);
            }
        },
        [&](UndoErase& s) {
            auto parent_path = Path{s.path.begin(), std::prev(s.path.end())};
            auto& parent = resolve(tree_, parent_path);
            if (auto* map = parent.get_if<Mapping>()) {
                map->insert_at(s.position, token_text(s.path.back()), std::move(s.value));
            } else {
                auto& seq = parent.as_sequence();
                seq.insert(seq.begin() + static_cast<std::ptrdiff_t>(s.position), std::move(s.value));
            }
        },
        [&](UndoSet& s) {
            if (s.previous) {
                docdelta_cpp::set(tree_, s.path, std::move(*s.previous));
            } else {
                docdelta_cpp::erase(tree_, s.path);
            }
        },
    }, step);
}

}  // namespace docdelta_cpp::detail
