#include "sandbox/sandbox.hpp"

#include <algorithm>

#include "glog/logging.h"

namespace sandbox {

Sandbox::store_t* Sandbox::Boxes_() {
  static store_t* boxes = new store_t;
  return boxes;
}

void Sandbox::Register_(std::string name, Sandbox::create_t create,
                        Sandbox::score_t score) {
  Boxes_()->push_back(Entry{std::move(name), std::move(create),
                            std::move(score)});
}

const std::vector<const Sandbox::Entry*>& Sandbox::Ranked_() {
  static const std::vector<const Entry*> ranked = [] {
    std::vector<std::pair<int, const Entry*>> scored;
    for (const Entry& entry : *Boxes_()) {
      int score = entry.score();
      VLOG(1) << "Sandbox " << entry.name << " has score " << score;
      if (score > 0) scored.emplace_back(score, &entry);
    }
    std::stable_sort(scored.begin(), scored.end(),
                     [](const std::pair<int, const Entry*>& a,
                        const std::pair<int, const Entry*>& b) {
                       return a.first > b.first;
                     });
    std::vector<const Entry*> result;
    for (const auto& s : scored) result.push_back(s.second);
    return result;
  }();
  return ranked;
}

std::unique_ptr<Sandbox> Sandbox::Create() {
  const std::vector<const Entry*>& ranked = Ranked_();
  if (ranked.empty()) {
    LOG(ERROR) << "No sandbox could be found";
    return nullptr;
  }
  return std::unique_ptr<Sandbox>(ranked.front()->create());
}

std::unique_ptr<Sandbox> Sandbox::Create(const std::string& name) {
  if (name.empty()) return Create();
  for (const Entry* entry : Ranked_()) {
    if (entry->name == name) return std::unique_ptr<Sandbox>(entry->create());
  }
  LOG(ERROR) << "Sandbox " << name << " is not available";
  return nullptr;
}

std::vector<std::string> Sandbox::Available() {
  std::vector<std::string> names;
  for (const Entry* entry : Ranked_()) names.push_back(entry->name);
  return names;
}

}  // namespace sandbox
