/**
 * ************************************************************************
 *
 * @file Diagnostics.cpp
 * @author AnakinLiu (azrael2759@qq.com)
 * @date 2026-10-19
 * @version 0.1
 * @brief 诊断文本与聚合消息实现
 *
 * ************************************************************************
 * @copyright Copyright (c) 2026 AnakinLiu
 * For study and research only, no reprinting.
 * ************************************************************************
 */
#include "Diagnostics.hpp"

#include <format>

namespace wire
{

std::string_view ToString(DiagnosticCode code)
{
    switch (code)
    {
        case DiagnosticCode::UndefinedComponentsUsed:
            return "undefined-components-used";
        case DiagnosticCode::MissingRequiredBoundValue:
            return "missing-required-bound-value";
        case DiagnosticCode::LayoutChildrenArity:
            return "layout-children-arity";
        case DiagnosticCode::ChildrenSlotOutsideDefinition:
            return "children-slot-outside-layout-definition";
        case DiagnosticCode::ChildrenSlotMissingChild:
            return "children-slot-missing-child";
        case DiagnosticCode::InvalidDefinitionBody:
            return "invalid-definition-body";
        case DiagnosticCode::UnknownContainerType:
            return "unknown-container-type";
        case DiagnosticCode::InvalidContract:
            return "invalid-contract";
        case DiagnosticCode::MissingBoundValue:
            return "missing-bound-value";
        case DiagnosticCode::UnusedDefinitionArgument:
            return "unused-definition-argument";
    }
    return "unknown";
}

std::string CompositionError::message() const
{
    std::string text;
    switch (failure)
    {
        case CompositionFailure::UndefinedComponentsUsed:
        {
            std::string names;
            for (const auto& name : undefinedComponents)
            {
                if (!names.empty()) names += ", ";
                names += name;
            }
            text = std::format("Components used but not defined: {}\n"
                               "Define these components with: define Component \"Name\" {{ ... }}",
                               names);
            break;
        }
        case CompositionFailure::CompositionFailed:
            text = "IR generation failed with semantic errors:";
            break;
        case CompositionFailure::InvalidContract:
            text = "IR contract validation failed:";
            break;
    }

    if (failure != CompositionFailure::UndefinedComponentsUsed)
    {
        for (const auto& diagnostic : diagnostics)
        {
            text += std::format("\n- [{}] {}", ToString(diagnostic.code), diagnostic.message);
        }
    }
    return text;
}

} // namespace wire
