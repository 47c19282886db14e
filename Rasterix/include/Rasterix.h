#pragma once

#include <Common/Types.h>
#include <Common/Errors.h>
#include <Common/Logger.h>
#include <Backend/GpgpuContext.h>
#include <Core/ShapeUtil.h>
#include <Core/TensorData.h>
#include <Core/GpgpuProgram.h>
#include <Core/GpgpuBinary.h>
#include <Core/UniformTable.h>
#include <Core/ProgramCompiler.h>
#include <Core/ProgramRunner.h>
#include <Core/ProgramCache.h>
#include <Ops/ShaderGen.h>

#ifdef RX_WITH_VULKAN
#include <Backend/Vulkan/ShaderCompiler.h>
#include <Backend/Vulkan/UniformLayout.h>
#include <Backend/Vulkan/VulkanContext.h>
#endif
