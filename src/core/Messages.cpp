#include "Messages.hpp"
#include <iterator>

namespace mirror_launcher {

namespace {

struct MessageText {
    const char* english;
    const char* chinese;
};

constexpr MessageText kMessages[] = {
    // Window and panel text
    {"Mirror Launcher", "Mirror Launcher"},
    {"Mirror Monitor - streaming...", "Mirror Monitor - 投屏监控中..."},
    {"Device:", "选择设备:"},
    {"Scanning...", "正在扫描..."},
    {"No device found", "未检测到设备"},
    {"Refresh", "刷新"},
    {"Wireless", "无线连接"},
    {"Disconnect", "断开"},
    {"Manage...", "管理..."},
    {"Help", "帮助"},
    {"Language:", "语言:"},
    {"STREAM PARAMETERS", "推流参数"},
    {"Max Size", "最大分辨率 (Max Size)"},
    {"Max FPS", "帧率限制 (Max FPS)"},
    {"Video Codec", "视频编码 (Codec)"},
    {"Bitrate", "传输码率 (Bitrate)"},
    {"Window Position", "窗口位置 (Window Position)"},
    {"Native", "原生 (Native)"},
    {"H.264 (Low Latency)", "H.264 (低延迟)"},
    {"H.265 (High Quality)", "H.265 (高画质)"},
    {"Center", "居中 (Center)"},
    {"Top-Left", "左上角 (Top-Left)"},
    {"Top-Right", "右上角 (Top-Right)"},
    {"Turn Screen Off", "启动即熄屏"},
    {"If you have a lock screen, the unlock UI may not display.\n"
     "Recommend: uncheck this, then press LCtrl+O after connecting.",
     "若有锁屏密码，投屏可能无法显示解锁界面。\n建议取消勾选，连接后按 LCtrl+O 熄屏。"},
    {"Borderless Mode", "无边框模式"},
    {"Show Log", "显示运行日志"},
    {"Print FPS to Log", "在日志中打印 FPS"},
    {"START STREAM", "开始投屏"},
    {"CONSOLE OUTPUT", "运行日志"},
    {"Clear Logs", "清空日志"},
    {"Auto-configured for [%1 + %2GB RAM]", "已根据硬件 [%1 + %2GB RAM] 自动优化"},
    {"Wireless", "无线"},
    {"Unauthorized", "未授权"},

    // Dialogs
    {"Wireless Setup", "无线连接向导"},
    {"Enter phone IP address:\n\nTip: Go to Settings -> About Phone -> Status to find the IP",
     "请输入手机 IP 地址:\n\n提示：请前往 手机设置 -> 关于手机 -> 状态信息 查看 IP"},
    {"Wireless Connected", "无线连接成功"},
    {"Successfully connected to %1\n\nYou can unplug the USB cable now!",
     "已成功连接到 %1\n\n您现在可以拔掉 USB 线了！"},
    {"First-time Wireless Connection", "首次无线连接提示"},
    {"No device detected.\n\nFor a first-time wireless connection:\n\n"
     "1. Connect via USB - the IP is detected automatically\n\n"
     "2. If you know the device IP, choose 'Yes' to enter it manually",
     "未检测到设备。\n\n首次无线连接有两种方式：\n\n"
     "① 使用 USB 线连接手机，程序会自动获取 IP 并连接\n\n"
     "② 如果已知手机 IP 地址，点击「是」手动输入"},
    {"Wireless Device Management", "无线设备管理"},
    {"Disconnect", "断开"},
    {"Disconnect All", "断开所有无线设备"},
    {"No wireless devices connected\n\nUse the 'Wireless' button to connect devices",
     "当前没有已连接的无线设备\n\n通过「无线连接」按钮添加设备"},
    {"Confirm Disconnect", "确认断开"},
    {"Are you sure you want to disconnect '%1'?", "确定要断开无线设备 '%1' 吗？"},
    {"Getting Started", "使用向导"},
    {"Don't show again", "下次不再显示"},
    {"Previous", "上一页"},
    {"Next", "下一页"},
    {"Start", "开始使用"},
    {"Connection modes", "连接模式概览"},
    {"1. USB: no network needed, lowest latency and best quality.\n"
     "   Connect the cable and enable USB debugging.\n\n"
     "2. Wi-Fi: phone and computer on the same network.\n"
     "   No cable, fine for everyday use.",
     "1. 有线模式 (USB):\n无需网络，延迟最低，画质最高。\n只需用数据线连接电脑，并开启 USB 调试即可。\n\n"
     "2. 无线模式 (Wi-Fi):\n需要手机和电脑在同一 Wi-Fi 下。\n摆脱线缆束缚，适合日常轻度使用。"},
    {"Preparation", "准备工作"},
    {"Enabling USB debugging:\n\n"
     "1. Settings -> About phone -> tap Build number 7 times.\n\n"
     "2. Settings -> Developer options -> enable USB debugging.\n\n"
     "3. Connect to the computer and allow the authorization prompt.",
     "如何开启 USB 调试?\n\n"
     "1. 手机设置 -> 关于手机 -> 连续点击 7 次【版本号】开启开发者模式。\n\n"
     "2. 返回设置 -> 开发者选项 -> 开启【USB 调试】。\n\n"
     "3. 连接电脑后，手机上弹出授权框，请点击【允许】。"},
    {"Wireless mirroring", "无线投屏步骤"},
    {"The first connection needs the cable:\n\n"
     "1. Plug in the USB cable and make sure the device shows up.\n\n"
     "2. Press the Wireless button at the top.\n\n"
     "3. Unplug the cable once the success message appears.\n\n"
     "If it fails, check that both are on the same Wi-Fi network.",
     "首次连接需要插线:\n\n"
     "1. 先插上 USB 线，确保有线连接成功。\n\n"
     "2. 点击软件顶部的【无线连接】按钮。\n\n"
     "3. 等待提示成功后，拔掉数据线即可。\n\n"
     "注意：如果失败，请检查两者是否在同一 Wi-Fi 网络。"},
    {"Shortcuts", "快捷键与技巧"},
    {"Shortcuts use Left Ctrl:\n\n"
     "LCtrl + F: fullscreen\n"
     "LCtrl + P: screen on/off\n"
     "LCtrl + H: home",
     "常用快捷键 (已改为左Ctrl以避免冲突):\n\n"
     "左Ctrl + F: 全屏模式\n"
     "左Ctrl + P: 点亮/关闭屏幕\n"
     "左Ctrl + H: 返回桌面 (Home)"},

    // Log lines
    {"Device hotplug monitor started", "设备热插拔监听已启动"},
    {"Found %1 device(s)", "找到 %1 台设备"},
    {"No devices found", "未检测到设备"},
    {"Refreshing device list...", "正在刷新设备列表..."},
    {"Device change detected, refreshing...", "检测到设备变化，自动刷新..."},
    {"Getting device details...", "正在获取设备详细信息..."},
    {"Auto-selected wireless device: %1", "已自动选择无线设备: %1"},
    {"ADB not found. Please ensure adb is installed or in PATH.", "未找到 ADB。请确保 adb 在 PATH 环境变量中。"},
    {"ADB command timed out.", "ADB 命令超时。"},
    {"Failed to scan devices: %1", "扫描设备失败: %1"},
    {"Connecting to %1...", "正在连接 %1..."},
    {"Successfully connected to %1", "已成功连接到 %1"},
    {"Connection may have failed: %1", "连接可能失败: %1"},
    {"Connection timed out. Check if the IP is correct.", "连接超时。请检查 IP 是否正确。"},
    {"Failed to connect: %1", "连接失败: %1"},
    {"Enabling TCP/IP mode on %1...", "正在对 %1 启用 TCP/IP 模式..."},
    {"Failed to enable TCP/IP mode: %1", "启用 TCP/IP 模式失败: %1"},
    {"Waiting 2 seconds for the device to restart ADB...", "等待 2 秒让设备重启 ADB..."},
    {"Detected device IP: %1", "检测到设备 IP: %1"},
    {"Could not find a wlan0 IP in the route output.", "路由输出中未找到 wlan0 IP。"},
    {"Failed to auto-detect IP, falling back to manual input.", "无法自动检测 IP，将使用手动输入。"},
    {"Detected USB device: %1", "检测到 USB 设备: %1"},
    {"No USB device detected, please enter the IP manually.", "未检测到 USB 设备，请手动输入 IP。"},
    {"No device available for a first-time wireless connection", "首次无线连接未检测到设备"},
    {"Disconnecting device: %1...", "正在断开设备: %1..."},
    {"Disconnected wireless device: %1", "已断开无线设备连接: %1"},
    {"Failed to disconnect device: %1", "断开设备失败: %1"},
    {"USB devices cannot be disconnected manually. Please unplug the cable.", "USB 设备无法手动断开，请直接拔掉数据线。"},
    {"No valid device selected.", "未选择有效设备。"},
    {"All wireless devices disconnected", "已断开所有无线设备"},
    {"No valid device selected.", "未选择有效设备。"},
    {"A mirroring session is already running.", "投屏会话已在运行。"},
    {"Mirroring tool not found at: %1", "未找到投屏程序: %1"},
    {"Failed to launch the mirroring tool: %1", "投屏程序启动失败: %1"},
    {"Mirroring tool launched successfully!", "投屏程序启动成功！"},
    {"Entered monitoring mode, the launcher exits when the mirror window closes",
     "已进入监控模式，关闭投屏窗口后程序将自动退出"},
    {"Silent mode: main window hidden, it comes back when the mirror window closes",
     "纯净模式：隐藏主窗口，关闭投屏窗口后自动恢复"},
    {"Mirroring tool exited normally.", "投屏程序已正常退出。"},
    {"Mirroring tool exited with code: %1", "投屏程序异常退出，代码: %1"},
    {"Mirror window closed, exiting...", "检测到投屏窗口已关闭，准备退出..."},
    {"Mirroring finished, main window restored", "投屏已结束，主窗口已恢复"},
    {"[AutoConfig] Device: %1 | Screen: %2 | PC RAM: %3GB", "[AutoConfig] 设备: %1 | 屏幕: %2 | PC RAM: %3GB"},
    {"[AutoConfig] Recommended: %1 | %2 fps | %3M | %4", "[AutoConfig] 推荐: %1 | %2 fps | %3M | %4"},
};

static_assert(std::size(kMessages) == static_cast<size_t>(MessageId::Count),
              "message table out of sync with MessageId");

} // namespace

QString message(MessageId id, Language language) {
    const auto& entry = kMessages[static_cast<size_t>(id)];
    return QString::fromUtf8(language == Language::Chinese ? entry.chinese : entry.english);
}

std::string languageCode(Language language) {
    return language == Language::Chinese ? "zh" : "en";
}

Language languageFromCode(const std::string& code, Language fallback) {
    if (code == "zh") return Language::Chinese;
    if (code == "en") return Language::English;
    return fallback;
}

} // namespace mirror_launcher
