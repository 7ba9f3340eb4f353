#pragma once

#include <string>

#include "internal/core/hint_tracker.hpp"
#include "internal/db/model/phrase_record.hpp"
#include "phrase/manager/v1.hpp"

namespace phrase::service {

phrase::manager::v1::Phrase ToProto(const db::model::PhraseRecord& record, const std::string& sender_name);

phrase::manager::v1::HintProgress ToProto(const core::HintStatus& status);

}
