#include <horde/ai/animation_binding.hpp>
#include <horde/core/log.hpp>

namespace horde::ai {

namespace clips {

const std::vector<std::string>& dance_names() {
    static const std::vector<std::string> names = {
        "Booty_Hip_Hop_Dance",
        "Shopping_Cart_Dance",
        "Snake_Hip_Hop_Dance",
        "Step_Hip_Hop_Dance",
        "Tut_Hip_Hop_Dance",
        "Thriller_Part_2",
        "Thriller_Part_4"
    };
    return names;
}

const std::vector<std::string>& attack_names() {
    static const std::vector<std::string> names = {
        "attack_slash",
        "attack_kick"
    };
    return names;
}

std::vector<std::string> all_names() {
    std::vector<std::string> names = {
        Idle, RunForward, RunBackward, RunLeft, RunRight,
        Impact, Dying, Tripping, Throw
    };
    names.insert(names.end(), attack_names().begin(), attack_names().end());
    names.insert(names.end(), dance_names().begin(), dance_names().end());
    return names;
}

} // namespace clips

size_t AnimationBinding::load(animation::IClipSource& source) {
    m_library.clear();

    for (const auto& name : clips::all_names()) {
        auto clip = source.load_clip(name);
        if (!clip) {
            core::log(core::LogLevel::Warn, "[AnimationLibrary] Missing clip: " + name);
            continue;
        }

        auto result = animation::retarget_clip(*clip, animation::mixamo_bone_map(), m_retarget);
        if (result.matched) {
            core::log(core::LogLevel::Debug, "[AnimationLibrary] Retargeted " + name + ": " +
                std::to_string(result.renamed) + " renamed, " +
                std::to_string(result.unmapped) + " unmapped, " +
                std::to_string(result.stripped) + " translation channels stripped");
        }

        m_library.add(name, clip);
    }

    m_dances = m_library.filter_available(clips::dance_names());
    m_attacks = m_library.filter_available(clips::attack_names());

    if (m_dances.empty()) {
        core::log(core::LogLevel::Warn, "[AnimationLibrary] No dance clips, dancing disabled");
    }
    if (!m_library.has(clips::Throw)) {
        core::log(core::LogLevel::Warn, "[AnimationLibrary] No throw clip, throwing disabled");
    }

    core::log(core::LogLevel::Info, "[AnimationLibrary] Loaded " + std::to_string(m_library.size()) +
        " of " + std::to_string(clips::all_names().size()) + " clips");
    return m_library.size();
}

bool AnimationBinding::play(Agent& agent, const std::string& name,
                            const animation::PlayOptions& options) {
    auto clip = m_library.get(name);
    bool found = clip != nullptr;

    if (!clip && name != clips::Idle) {
        clip = m_library.get(clips::Idle);
    }
    if (!clip) {
        return false;
    }

    agent.mixer.play(clip, options);
    agent.current_clip = found ? name : std::string(clips::Idle);
    return found;
}

float AnimationBinding::duration_or(const std::string& name, float fallback) const {
    return m_library.duration_or(name, fallback);
}

} // namespace horde::ai
