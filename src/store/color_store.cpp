#include <favorite_colors/store/color_store.hpp>

#include <algorithm>
#include <mutex>
#include <sstream>

namespace favorite_colors {

std::string FormatColorList(const std::vector<std::string>& colors) {
    if (colors.empty()) {
        return "You have no favorite colors yet.";
    }

    std::ostringstream oss;
    oss << "Your favorite colors (" << colors.size() << " total):\n";
    for (std::size_t i = 0; i < colors.size(); ++i) {
        oss << (i + 1) << ". " << colors[i] << "\n";
    }
    return oss.str();
}

AddOutcome ColorStore::Add(const std::string& color) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (std::find(colors_.begin(), colors_.end(), color) != colors_.end()) {
        return {"Color '" + color + "' is already in your favorites", false};
    }

    colors_.push_back(color);
    return {"Successfully added '" + color + "' to your favorite colors!", true};
}

ColorSnapshot ColorStore::Get() const {
    std::vector<std::string> copy;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        copy = colors_;
    }

    auto text = FormatColorList(copy);
    return {std::move(copy), std::move(text)};
}

RemoveOutcome ColorStore::Remove(const std::string& color) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = std::find(colors_.begin(), colors_.end(), color);
    if (it == colors_.end()) {
        return {"Color '" + color + "' was not found in your favorites", false};
    }

    // vector::erase keeps the remaining elements in order.
    colors_.erase(it);
    return {"Successfully removed '" + color + "' from your favorite colors!", true};
}

ClearOutcome ColorStore::Clear() {
    std::size_t cleared = 0;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        cleared = colors_.size();
        colors_.clear();
    }

    return {"Successfully cleared " + std::to_string(cleared) +
                " favorite colors!",
            cleared};
}

std::size_t ColorStore::Count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return colors_.size();
}

} // namespace favorite_colors
