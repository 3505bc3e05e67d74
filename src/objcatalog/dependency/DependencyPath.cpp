#include "DependencyPath.hpp"
#include "field/Field.hpp"
#include "field/FieldNode.hpp"
#include "node/Node.hpp"

#include <algorithm>
#include <cctype>

namespace OC {

namespace {

auto isIndex(std::string_view segment) -> bool {
    return !segment.empty() && std::all_of(segment.begin(), segment.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
}

auto invalid(std::string_view path, std::string const& reason) -> Error {
    return Error{Error::Code::InvalidPath, "dependency path \"" + std::string{path} + "\": " + reason};
}

} // namespace

auto DependencyPath::Parse(std::string_view text) -> Expected<DependencyPath> {
    DependencyPath path;
    path.text = std::string{text};

    auto rest = text;
    if (rest.starts_with('/')) {
        path.fromRoot = true;
        rest.remove_prefix(1);
    }
    if (rest.empty())
        return std::unexpected(invalid(text, "no field name"));

    std::vector<std::string_view> segments;
    for (std::size_t start = 0;;) {
        auto const slash = rest.find('/', start);
        segments.push_back(rest.substr(start, slash == std::string_view::npos ? std::string_view::npos : slash - start));
        if (slash == std::string_view::npos)
            break;
        start = slash + 1;
    }

    for (std::size_t i = 0; i + 1 < segments.size(); ++i) {
        auto const segment = segments[i];
        if (segment.empty())
            return std::unexpected(invalid(text, "empty segment at position " + std::to_string(i)));
        Step step;
        if (segment == "^") {
            step.kind = Step::Kind::Parent;
        } else if (segment.starts_with('^')) {
            step.kind = Step::Kind::Ancestor;
            step.name = std::string{segment.substr(1)};
        } else if (segment == ".") {
            step.kind = Step::Kind::FirstChild;
        } else if (isIndex(segment)) {
            step.kind  = Step::Kind::ChildIndex;
            step.index = std::stoul(std::string{segment});
        } else {
            step.kind = Step::Kind::ChildNamed;
            step.name = std::string{segment};
        }
        path.route.push_back(std::move(step));
    }

    auto const last = segments.back();
    if (last.empty() || last == "." || last.starts_with('^'))
        return std::unexpected(invalid(text, "no field name"));
    path.field = std::string{last};
    return path;
}

auto DependencyPath::locate(Node const& origin) const -> Expected<std::shared_ptr<Node>> {
    auto cursor = std::const_pointer_cast<Node>(origin.shared_from_this());
    if (this->fromRoot)
        cursor = cursor->root();

    for (auto const& step : this->route) {
        switch (step.kind) {
        case Step::Kind::Parent: {
            auto up = cursor->parent();
            if (!up)
                return std::unexpected(invalid(this->text, cursor->label() + " has no parent"));
            cursor = std::move(up);
            break;
        }
        case Step::Kind::Ancestor: {
            auto up = cursor->parent();
            while (up && !up->matchesName(step.name))
                up = up->parent();
            if (!up)
                return std::unexpected(invalid(this->text, "no parent matching \"" + step.name + "\" found"));
            cursor = std::move(up);
            break;
        }
        case Step::Kind::FirstChild:
        case Step::Kind::ChildIndex: {
            auto const index = step.kind == Step::Kind::FirstChild ? std::size_t{0} : step.index;
            auto       down  = cursor->child(index);
            if (!down)
                return std::unexpected(down.error());
            cursor = std::move(*down);
            break;
        }
        case Step::Kind::ChildNamed: {
            auto children = cursor->children();
            auto found    = std::find_if(children.begin(), children.end(), [&step](auto const& child) {
                return child->matchesName(step.name);
            });
            if (found == children.end())
                return std::unexpected(invalid(this->text, "no child matching \"" + step.name + "\" found"));
            cursor = *found;
            break;
        }
        }
    }
    return cursor;
}

auto DependencyPath::resolve(Node const& origin) const -> Expected<std::shared_ptr<Field>> {
    auto target = this->locate(origin);
    if (!target)
        return std::unexpected(target.error());
    auto container = std::dynamic_pointer_cast<FieldNode>(*target);
    if (!container)
        return std::unexpected(Error{Error::Code::NoSuchField, (*target)->label() + " has no fields"});
    return container->field(this->field);
}

} // namespace OC
