/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "gfx/mesh_pipeline.hpp"

#include <array>
#include <string>
#include <vector>

#include "gfx/mesh.hpp"
#include "gfx/swapchain.hpp"
#include "util/checks.hpp"
#include "util/read_file.hpp"

namespace {

std::vector<std::uint8_t> load_spirv(const std::string &path) {
    auto bytes = read_file_binary(path);
    if (bytes.empty() || bytes.size() % 4 != 0) {
        throw GfxError(ErrorKind::ResourceLoadFailed, "SPIR-V size not multiple of 4: " + path);
    }
    return bytes;
}

VkShaderModule make_module(VkDevice device, const std::vector<std::uint8_t> &bytes) {
    VkShaderModuleCreateInfo ci{VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO};
    ci.codeSize = bytes.size();
    ci.pCode = reinterpret_cast<const uint32_t *>(bytes.data());

    VkShaderModule mod{};
    vk_check(vkCreateShaderModule(device, &ci, nullptr, &mod), "vkCreateShaderModule");
    return mod;
}

} // namespace

ShaderBlobs load_shader_blobs(const std::string &shader_dir) {
    ShaderBlobs out;
    out.vert = load_spirv(shader_dir + "/mesh.vert.spv");
    out.frag = load_spirv(shader_dir + "/mesh.frag.spv");
    return out;
}

void MeshPipeline::init(VkDevice device) {
    // set=0: binding 0 = per-image UBO (vertex), binding 1 = texture (fragment)
    std::array<VkDescriptorSetLayoutBinding, 2> bindings{};
    bindings[0].binding = 0;
    bindings[0].descriptorType = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
    bindings[0].descriptorCount = 1;
    bindings[0].stageFlags = VK_SHADER_STAGE_VERTEX_BIT;

    bindings[1].binding = 1;
    bindings[1].descriptorType = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
    bindings[1].descriptorCount = 1;
    bindings[1].stageFlags = VK_SHADER_STAGE_FRAGMENT_BIT;

    VkDescriptorSetLayoutCreateInfo dslci{VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO};
    dslci.bindingCount = static_cast<uint32_t>(bindings.size());
    dslci.pBindings = bindings.data();
    vk_check(vkCreateDescriptorSetLayout(device, &dslci, nullptr, &dsl_), "vkCreateDescriptorSetLayout");
}

void MeshPipeline::shutdown(VkDevice device) {
    destroy(device);
    if (dsl_) {
        vkDestroyDescriptorSetLayout(device, dsl_, nullptr);
    }
    dsl_ = VK_NULL_HANDLE;
}

void MeshPipeline::create(VkDevice device, const Swapchain &sw, const ShaderBlobs &shaders) {
    VkPipelineLayoutCreateInfo plci{VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO};
    plci.setLayoutCount = 1;
    plci.pSetLayouts = &dsl_;
    vk_check(vkCreatePipelineLayout(device, &plci, nullptr, &layout_), "vkCreatePipelineLayout");

    VkShaderModule vs = make_module(device, shaders.vert);
    VkShaderModule fs = VK_NULL_HANDLE;
    try {
        fs = make_module(device, shaders.frag);
    } catch (...) {
        vkDestroyShaderModule(device, vs, nullptr);
        throw;
    }

    VkPipelineShaderStageCreateInfo stages[2]{};
    stages[0].sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
    stages[0].stage = VK_SHADER_STAGE_VERTEX_BIT;
    stages[0].module = vs;
    stages[0].pName = "main";

    stages[1].sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
    stages[1].stage = VK_SHADER_STAGE_FRAGMENT_BIT;
    stages[1].module = fs;
    stages[1].pName = "main";

    const auto binding = Vertex::binding();
    const auto attributes = Vertex::attributes();

    VkPipelineVertexInputStateCreateInfo vi{VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_STATE_CREATE_INFO};
    vi.vertexBindingDescriptionCount = 1;
    vi.pVertexBindingDescriptions = &binding;
    vi.vertexAttributeDescriptionCount = static_cast<uint32_t>(attributes.size());
    vi.pVertexAttributeDescriptions = attributes.data();

    VkPipelineInputAssemblyStateCreateInfo ia{VK_STRUCTURE_TYPE_PIPELINE_INPUT_ASSEMBLY_STATE_CREATE_INFO};
    ia.topology = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;
    ia.primitiveRestartEnable = VK_FALSE;

    // Fixed viewport/scissor: the pipeline is rebuilt together with the swapchain.
    VkViewport viewport{};
    viewport.x = 0.0f;
    viewport.y = 0.0f;
    viewport.width = static_cast<float>(sw.extent().width);
    viewport.height = static_cast<float>(sw.extent().height);
    viewport.minDepth = 0.0f;
    viewport.maxDepth = 1.0f;

    VkRect2D scissor{};
    scissor.offset = {0, 0};
    scissor.extent = sw.extent();

    VkPipelineViewportStateCreateInfo vp{VK_STRUCTURE_TYPE_PIPELINE_VIEWPORT_STATE_CREATE_INFO};
    vp.viewportCount = 1;
    vp.pViewports = &viewport;
    vp.scissorCount = 1;
    vp.pScissors = &scissor;

    VkPipelineRasterizationStateCreateInfo rs{VK_STRUCTURE_TYPE_PIPELINE_RASTERIZATION_STATE_CREATE_INFO};
    rs.polygonMode = VK_POLYGON_MODE_FILL;
    rs.cullMode = VK_CULL_MODE_NONE;
    rs.frontFace = VK_FRONT_FACE_COUNTER_CLOCKWISE;
    rs.lineWidth = 1.0f;

    VkPipelineMultisampleStateCreateInfo ms{VK_STRUCTURE_TYPE_PIPELINE_MULTISAMPLE_STATE_CREATE_INFO};
    ms.rasterizationSamples = VK_SAMPLE_COUNT_1_BIT;

    VkPipelineColorBlendAttachmentState cba{};
    cba.colorWriteMask =
        VK_COLOR_COMPONENT_R_BIT | VK_COLOR_COMPONENT_G_BIT | VK_COLOR_COMPONENT_B_BIT | VK_COLOR_COMPONENT_A_BIT;
    cba.blendEnable = VK_TRUE;
    cba.srcColorBlendFactor = VK_BLEND_FACTOR_SRC_ALPHA;
    cba.dstColorBlendFactor = VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA;
    cba.colorBlendOp = VK_BLEND_OP_ADD;
    cba.srcAlphaBlendFactor = VK_BLEND_FACTOR_ONE;
    cba.dstAlphaBlendFactor = VK_BLEND_FACTOR_ZERO;
    cba.alphaBlendOp = VK_BLEND_OP_ADD;

    VkPipelineColorBlendStateCreateInfo cb{VK_STRUCTURE_TYPE_PIPELINE_COLOR_BLEND_STATE_CREATE_INFO};
    cb.attachmentCount = 1;
    cb.pAttachments = &cba;

    VkGraphicsPipelineCreateInfo gpci{VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO};
    gpci.stageCount = 2;
    gpci.pStages = stages;
    gpci.pVertexInputState = &vi;
    gpci.pInputAssemblyState = &ia;
    gpci.pViewportState = &vp;
    gpci.pRasterizationState = &rs;
    gpci.pMultisampleState = &ms;
    gpci.pColorBlendState = &cb;
    gpci.layout = layout_;
    gpci.renderPass = sw.render_pass();
    gpci.subpass = 0;

    VkResult r = vkCreateGraphicsPipelines(device, VK_NULL_HANDLE, 1, &gpci, nullptr, &pipe_);

    vkDestroyShaderModule(device, fs, nullptr);
    vkDestroyShaderModule(device, vs, nullptr);
    vk_check(r, "vkCreateGraphicsPipelines");

    create_framebuffers(device, sw);
}

void MeshPipeline::create_framebuffers(VkDevice device, const Swapchain &sw) {
    fb_.assign(sw.image_views().size(), VK_NULL_HANDLE);

    for (size_t i = 0; i < sw.image_views().size(); i++) {
        VkImageView att[] = {sw.image_views()[i]};

        VkFramebufferCreateInfo fci{VK_STRUCTURE_TYPE_FRAMEBUFFER_CREATE_INFO};
        fci.renderPass = sw.render_pass();
        fci.attachmentCount = 1;
        fci.pAttachments = att;
        fci.width = sw.extent().width;
        fci.height = sw.extent().height;
        fci.layers = 1;

        vk_check(vkCreateFramebuffer(device, &fci, nullptr, &fb_[i]), "vkCreateFramebuffer");
    }
}

void MeshPipeline::destroy_framebuffers(VkDevice device) {
    for (auto f : fb_) {
        if (f) {
            vkDestroyFramebuffer(device, f, nullptr);
        }
    }
    fb_.clear();
}

void MeshPipeline::destroy(VkDevice device) {
    destroy_framebuffers(device);

    if (pipe_) {
        vkDestroyPipeline(device, pipe_, nullptr);
    }
    if (layout_) {
        vkDestroyPipelineLayout(device, layout_, nullptr);
    }

    pipe_ = VK_NULL_HANDLE;
    layout_ = VK_NULL_HANDLE;
}
