#include "errors.h"

std::string conflictResourceToString(ConflictResource r) {
    switch (r) {
        case ConflictResource::Teacher:    return "teacher";
        case ConflictResource::Room:       return "room";
        case ConflictResource::Section:    return "section";
        case ConflictResource::Assignment: return "assignment";
    }
    return "unknown";
}

std::string moveRuleToString(MoveRule rule) {
    switch (rule) {
        case MoveRule::UnknownSlot:        return "unknown_slot";
        case MoveRule::UnknownTimeSlot:    return "unknown_time_slot";
        case MoveRule::UnknownRoom:        return "unknown_room";
        case MoveRule::BreakSlot:          return "break_slot";
        case MoveRule::BlockNotContiguous: return "block_not_contiguous";
        case MoveRule::RoomCapacity:       return "room_capacity";
        case MoveRule::RoomType:           return "room_type";
        case MoveRule::RoomInactive:       return "room_inactive";
        case MoveRule::TeacherUnavailable: return "teacher_unavailable";
        case MoveRule::RoomUnavailable:    return "room_unavailable";
        case MoveRule::RoomConflict:       return "room_conflict";
        case MoveRule::TeacherConflict:    return "teacher_conflict";
        case MoveRule::SectionConflict:    return "section_conflict";
    }
    return "unknown";
}
