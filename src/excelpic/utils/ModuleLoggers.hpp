#pragma once
#include "Logger.hpp"

/**
 * @file ModuleLoggers.hpp
 * @brief 模块化日志宏定义
 *
 * 每个模块使用自己的日志器名称，便于在日志文件中定位来源。
 */

// 工作簿句柄 (core)
#define WORKBOOK_DEBUG(...)    EXCELPIC_LOG_DEBUG("excelpic.workbook", __VA_ARGS__)
#define WORKBOOK_INFO(...)     EXCELPIC_LOG_INFO("excelpic.workbook", __VA_ARGS__)
#define WORKBOOK_WARN(...)     EXCELPIC_LOG_WARN("excelpic.workbook", __VA_ARGS__)
#define WORKBOOK_ERROR(...)    EXCELPIC_LOG_ERROR("excelpic.workbook", __VA_ARGS__)

// 自动化宿主 (automation)
#define AUTOMATION_DEBUG(...)  EXCELPIC_LOG_DEBUG("excelpic.automation", __VA_ARGS__)
#define AUTOMATION_INFO(...)   EXCELPIC_LOG_INFO("excelpic.automation", __VA_ARGS__)
#define AUTOMATION_WARN(...)   EXCELPIC_LOG_WARN("excelpic.automation", __VA_ARGS__)
#define AUTOMATION_ERROR(...)  EXCELPIC_LOG_ERROR("excelpic.automation", __VA_ARGS__)

// 区域发布 (publish)
#define PUBLISH_DEBUG(...)     EXCELPIC_LOG_DEBUG("excelpic.publish", __VA_ARGS__)
#define PUBLISH_INFO(...)      EXCELPIC_LOG_INFO("excelpic.publish", __VA_ARGS__)
#define PUBLISH_WARN(...)      EXCELPIC_LOG_WARN("excelpic.publish", __VA_ARGS__)
#define PUBLISH_ERROR(...)     EXCELPIC_LOG_ERROR("excelpic.publish", __VA_ARGS__)

// HTML清理 (markup)
#define MARKUP_DEBUG(...)      EXCELPIC_LOG_DEBUG("excelpic.markup", __VA_ARGS__)
#define MARKUP_INFO(...)       EXCELPIC_LOG_INFO("excelpic.markup", __VA_ARGS__)
#define MARKUP_WARN(...)       EXCELPIC_LOG_WARN("excelpic.markup", __VA_ARGS__)
#define MARKUP_ERROR(...)      EXCELPIC_LOG_ERROR("excelpic.markup", __VA_ARGS__)

// 图片渲染 (render)
#define RENDER_DEBUG(...)      EXCELPIC_LOG_DEBUG("excelpic.render", __VA_ARGS__)
#define RENDER_INFO(...)       EXCELPIC_LOG_INFO("excelpic.render", __VA_ARGS__)
#define RENDER_WARN(...)       EXCELPIC_LOG_WARN("excelpic.render", __VA_ARGS__)
#define RENDER_ERROR(...)      EXCELPIC_LOG_ERROR("excelpic.render", __VA_ARGS__)

// 工具模块 (utils)
#define UTILS_DEBUG(...)       EXCELPIC_LOG_DEBUG("excelpic.utils", __VA_ARGS__)
#define UTILS_WARN(...)        EXCELPIC_LOG_WARN("excelpic.utils", __VA_ARGS__)
#define UTILS_ERROR(...)       EXCELPIC_LOG_ERROR("excelpic.utils", __VA_ARGS__)

// 导出入口 (api)
#define EXPORT_INFO(...)       EXCELPIC_LOG_INFO("excelpic", __VA_ARGS__)
#define EXPORT_WARN(...)       EXCELPIC_LOG_WARN("excelpic", __VA_ARGS__)
#define EXPORT_ERROR(...)      EXCELPIC_LOG_ERROR("excelpic", __VA_ARGS__)
