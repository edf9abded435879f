#include <XNS/Namespaces/Vocabulary.hpp>

#include <array>

namespace XNS::Namespaces
{
    namespace
    {
        struct VocabularyEntry
        {
            std::string_view namespaceUri;
            std::string_view prefix;
            std::string_view schemaLocation;
        };

        constexpr std::string_view kXsiNamespace = "http://www.w3.org/2001/XMLSchema-instance";

        constexpr std::array kXmlNamespaces {
                VocabularyEntry {kXsiNamespace, "xsi", {}},
                VocabularyEntry {"http://www.w3.org/2001/XMLSchema", "xs", {}},
                VocabularyEntry {"http://www.w3.org/1999/xlink", "xlink", {}},
                VocabularyEntry {"http://www.w3.org/2000/09/xmldsig#", "ds", {}},
        };

        // CybOX 2.1 core and object namespaces.
        constexpr std::array kCyboxNamespaces {
                VocabularyEntry {"http://cybox.mitre.org/cybox-2", "cybox", "http://cybox.mitre.org/XMLSchema/core/2.1/cybox_core.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/common-2", "cyboxCommon", "http://cybox.mitre.org/XMLSchema/common/2.1/cybox_common.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/default_vocabularies-2", "cyboxVocabs", "http://cybox.mitre.org/XMLSchema/default_vocabularies/2.1/cybox_default_vocabularies.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#AccountObject-2", "AccountObj", "http://cybox.mitre.org/XMLSchema/objects/Account/2.1/Account_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#AddressObject-2", "AddressObj", "http://cybox.mitre.org/XMLSchema/objects/Address/2.1/Address_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#APIObject-2", "APIObj", "http://cybox.mitre.org/XMLSchema/objects/API/2.1/API_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#ArchiveFileObject-1", "ArchiveFileObj", "http://cybox.mitre.org/XMLSchema/objects/Archive_File/1.0/Archive_File_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#ARPCacheObject-1", "ARPCacheObj", "http://cybox.mitre.org/XMLSchema/objects/ARP_Cache/1.0/ARP_Cache_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#ArtifactObject-2", "ArtifactObj", "http://cybox.mitre.org/XMLSchema/objects/Artifact/2.1/Artifact_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#ASObject-1", "ASObj", "http://cybox.mitre.org/XMLSchema/objects/AS/1.0/AS_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#CodeObject-2", "CodeObj", "http://cybox.mitre.org/XMLSchema/objects/Code/2.1/Code_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#CustomObject-1", "CustomObj", "http://cybox.mitre.org/XMLSchema/objects/Custom/1.1/Custom_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#DeviceObject-2", "DeviceObj", "http://cybox.mitre.org/XMLSchema/objects/Device/2.1/Device_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#DiskObject-2", "DiskObj", "http://cybox.mitre.org/XMLSchema/objects/Disk/2.1/Disk_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#DiskPartitionObject-2", "DiskPartitionObj", "http://cybox.mitre.org/XMLSchema/objects/Disk_Partition/2.1/Disk_Partition_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#DNSCacheObject-2", "DNSCacheObj", "http://cybox.mitre.org/XMLSchema/objects/DNS_Cache/2.1/DNS_Cache_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#DNSQueryObject-2", "DNSQueryObj", "http://cybox.mitre.org/XMLSchema/objects/DNS_Query/2.1/DNS_Query_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#DNSRecordObject-2", "DNSRecordObj", "http://cybox.mitre.org/XMLSchema/objects/DNS_Record/2.1/DNS_Record_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#DomainNameObject-1", "DomainNameObj", "http://cybox.mitre.org/XMLSchema/objects/Domain_Name/1.0/Domain_Name_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#EmailMessageObject-2", "EmailMessageObj", "http://cybox.mitre.org/XMLSchema/objects/Email_Message/2.1/Email_Message_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#FileObject-2", "FileObj", "http://cybox.mitre.org/XMLSchema/objects/File/2.1/File_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#GUIDialogboxObject-2", "GUIDialogBoxObj", "http://cybox.mitre.org/XMLSchema/objects/GUI_Dialogbox/2.1/GUI_Dialogbox_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#GUIObject-2", "GUIObj", "http://cybox.mitre.org/XMLSchema/objects/GUI/2.1/GUI_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#GUIWindowObject-2", "GUIWindowObj", "http://cybox.mitre.org/XMLSchema/objects/GUI_Window/2.1/GUI_Window_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#HostnameObject-1", "HostnameObj", "http://cybox.mitre.org/XMLSchema/objects/Hostname/1.0/Hostname_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#HTTPSessionObject-2", "HTTPSessionObj", "http://cybox.mitre.org/XMLSchema/objects/HTTP_Session/2.1/HTTP_Session_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#ImageFileObject-1", "ImageFileObj", "http://cybox.mitre.org/XMLSchema/objects/Image_File/1.0/Image_File_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#LibraryObject-2", "LibraryObj", "http://cybox.mitre.org/XMLSchema/objects/Library/2.1/Library_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#LinkObject-1", "LinkObj", "http://cybox.mitre.org/XMLSchema/objects/Link/1.1/Link_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#LinuxPackageObject-2", "LinuxPackageObj", "http://cybox.mitre.org/XMLSchema/objects/Linux_Package/2.1/Linux_Package_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#MemoryObject-2", "MemoryObj", "http://cybox.mitre.org/XMLSchema/objects/Memory/2.1/Memory_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#MutexObject-2", "MutexObj", "http://cybox.mitre.org/XMLSchema/objects/Mutex/2.1/Mutex_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#NetworkConnectionObject-2", "NetworkConnectionObj", "http://cybox.mitre.org/XMLSchema/objects/Network_Connection/2.1/Network_Connection_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#NetFlowObject-2", "NetFlowObj", "http://cybox.mitre.org/XMLSchema/objects/Network_Flow/2.1/Network_Flow_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#PacketObject-2", "PacketObj", "http://cybox.mitre.org/XMLSchema/objects/Network_Packet/2.1/Network_Packet_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#NetworkRouteEntryObject-2", "NetworkRouteEntryObj", "http://cybox.mitre.org/XMLSchema/objects/Network_Route_Entry/2.1/Network_Route_Entry_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#NetworkRouteObject-2", "NetworkRouteObj", "http://cybox.mitre.org/XMLSchema/objects/Network_Route/2.1/Network_Route_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#NetworkSocketObject-2", "NetworkSocketObj", "http://cybox.mitre.org/XMLSchema/objects/Network_Socket/2.1/Network_Socket_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#NetworkSubnetObject-2", "NetworkSubnetObj", "http://cybox.mitre.org/XMLSchema/objects/Network_Subnet/2.1/Network_Subnet_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#PDFFileObject-1", "PDFFileObj", "http://cybox.mitre.org/XMLSchema/objects/PDF_File/1.1/PDF_File_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#PipeObject-2", "PipeObj", "http://cybox.mitre.org/XMLSchema/objects/Pipe/2.1/Pipe_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#PortObject-2", "PortObj", "http://cybox.mitre.org/XMLSchema/objects/Port/2.1/Port_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#ProcessObject-2", "ProcessObj", "http://cybox.mitre.org/XMLSchema/objects/Process/2.1/Process_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#ProductObject-2", "ProductObj", "http://cybox.mitre.org/XMLSchema/objects/Product/2.1/Product_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#SemaphoreObject-2", "SemaphoreObj", "http://cybox.mitre.org/XMLSchema/objects/Semaphore/2.1/Semaphore_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#SMSMessageObject-1", "SMSMessageObj", "http://cybox.mitre.org/XMLSchema/objects/SMS_Message/1.0/SMS_Message_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#SocketAddressObject-1", "SocketAddressObj", "http://cybox.mitre.org/XMLSchema/objects/Socket_Address/1.1/Socket_Address_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#SystemObject-2", "SystemObj", "http://cybox.mitre.org/XMLSchema/objects/System/2.1/System_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#UnixFileObject-2", "UnixFileObj", "http://cybox.mitre.org/XMLSchema/objects/Unix_File/2.1/Unix_File_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#UnixNetworkRouteEntryObject-2", "UnixNetworkRouteEntryObj", "http://cybox.mitre.org/XMLSchema/objects/Unix_Network_Route_Entry/2.1/Unix_Network_Route_Entry_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#UnixPipeObject-2", "UnixPipeObj", "http://cybox.mitre.org/XMLSchema/objects/Unix_Pipe/2.1/Unix_Pipe_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#UnixProcessObject-2", "UnixProcessObj", "http://cybox.mitre.org/XMLSchema/objects/Unix_Process/2.1/Unix_Process_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#UnixUserAccountObject-2", "UnixUserAccountObj", "http://cybox.mitre.org/XMLSchema/objects/Unix_User_Account/2.1/Unix_User_Account_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#UnixVolumeObject-2", "UnixVolumeObj", "http://cybox.mitre.org/XMLSchema/objects/Unix_Volume/2.1/Unix_Volume_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#URIObject-2", "URIObj", "http://cybox.mitre.org/XMLSchema/objects/URI/2.1/URI_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#URLHistoryObject-1", "URLHistoryObj", "http://cybox.mitre.org/XMLSchema/objects/URL_History/1.0/URL_History_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#UserAccountObject-2", "UserAccountObj", "http://cybox.mitre.org/XMLSchema/objects/User_Account/2.1/User_Account_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#UserSessionObject-2", "UserSessionObj", "http://cybox.mitre.org/XMLSchema/objects/User_Session/2.1/User_Session_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#VolumeObject-2", "VolumeObj", "http://cybox.mitre.org/XMLSchema/objects/Volume/2.1/Volume_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#WhoisObject-2", "WhoisObj", "http://cybox.mitre.org/XMLSchema/objects/Whois/2.1/Whois_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#WinComputerAccountObject-2", "WinComputerAccountObj", "http://cybox.mitre.org/XMLSchema/objects/Win_Computer_Account/2.1/Win_Computer_Account_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#WinCriticalSectionObject-2", "WinCriticalSectionObj", "http://cybox.mitre.org/XMLSchema/objects/Win_Critical_Section/2.1/Win_Critical_Section_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#WinDriverObject-3", "WinDriverObj", "http://cybox.mitre.org/XMLSchema/objects/Win_Driver/3.0/Win_Driver_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#WinEventLogObject-2", "WinEventLogObj", "http://cybox.mitre.org/XMLSchema/objects/Win_Event_Log/2.1/Win_Event_Log_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#WinEventObject-2", "WinEventObj", "http://cybox.mitre.org/XMLSchema/objects/Win_Event/2.1/Win_Event_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#WinExecutableFileObject-2", "WinExecutableFileObj", "http://cybox.mitre.org/XMLSchema/objects/Win_Executable_File/2.1/Win_Executable_File_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#WinFileObject-2", "WinFileObj", "http://cybox.mitre.org/XMLSchema/objects/Win_File/2.1/Win_File_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#WinFilemappingObject-1", "WinFilemappingObj", "http://cybox.mitre.org/XMLSchema/objects/Win_Filemapping/1.0/Win_Filemapping_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#WinHandleObject-2", "WinHandleObj", "http://cybox.mitre.org/XMLSchema/objects/Win_Handle/2.1/Win_Handle_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#WinHookObject-1", "WinHookObj", "http://cybox.mitre.org/XMLSchema/objects/Win_Hook/1.0/Win_Hook_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#WinKernelHookObject-2", "WinKernelHookObj", "http://cybox.mitre.org/XMLSchema/objects/Win_Kernel_Hook/2.1/Win_Kernel_Hook_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#WinKernelObject-2", "WinKernelObj", "http://cybox.mitre.org/XMLSchema/objects/Win_Kernel/2.1/Win_Kernel_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#WinMailslotObject-2", "WinMailslotObj", "http://cybox.mitre.org/XMLSchema/objects/Win_Mailslot/2.1/Win_Mailslot_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#WinMemoryPageRegionObject-2", "WinMemoryPageRegionObj", "http://cybox.mitre.org/XMLSchema/objects/Win_Memory_Page_Region/2.1/Win_Memory_Page_Region_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#WinMutexObject-2", "WinMutexObj", "http://cybox.mitre.org/XMLSchema/objects/Win_Mutex/2.1/Win_Mutex_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#WinNetworkRouteEntryObject-2", "WinNetworkRouteEntryObj", "http://cybox.mitre.org/XMLSchema/objects/Win_Network_Route_Entry/2.1/Win_Network_Route_Entry_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#WinNetworkShareObject-2", "WinNetworkShareObj", "http://cybox.mitre.org/XMLSchema/objects/Win_Network_Share/2.1/Win_Network_Share_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#WinPipeObject-2", "WinPipeObj", "http://cybox.mitre.org/XMLSchema/objects/Win_Pipe/2.1/Win_Pipe_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#WinPrefetchObject-2", "WinPrefetchObj", "http://cybox.mitre.org/XMLSchema/objects/Win_Prefetch/2.1/Win_Prefetch_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#WinProcessObject-2", "WinProcessObj", "http://cybox.mitre.org/XMLSchema/objects/Win_Process/2.1/Win_Process_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#WinRegistryKeyObject-2", "WinRegistryKeyObj", "http://cybox.mitre.org/XMLSchema/objects/Win_Registry_Key/2.1/Win_Registry_Key_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#WinSemaphoreObject-2", "WinSemaphoreObj", "http://cybox.mitre.org/XMLSchema/objects/Win_Semaphore/2.1/Win_Semaphore_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#WinServiceObject-2", "WinServiceObj", "http://cybox.mitre.org/XMLSchema/objects/Win_Service/2.1/Win_Service_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#WinSystemObject-2", "WinSystemObj", "http://cybox.mitre.org/XMLSchema/objects/Win_System/2.1/Win_System_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#WinSystemRestoreObject-2", "WinSystemRestoreObj", "http://cybox.mitre.org/XMLSchema/objects/Win_System_Restore/2.1/Win_System_Restore_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#WinTaskObject-2", "WinTaskObj", "http://cybox.mitre.org/XMLSchema/objects/Win_Task/2.1/Win_Task_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#WinThreadObject-2", "WinThreadObj", "http://cybox.mitre.org/XMLSchema/objects/Win_Thread/2.1/Win_Thread_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#WinUserAccountObject-2", "WinUserAccountObj", "http://cybox.mitre.org/XMLSchema/objects/Win_User_Account/2.1/Win_User_Account_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#WinVolumeObject-2", "WinVolumeObj", "http://cybox.mitre.org/XMLSchema/objects/Win_Volume/2.1/Win_Volume_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#WinWaitableTimerObject-2", "WinWaitableTimerObj", "http://cybox.mitre.org/XMLSchema/objects/Win_Waitable_Timer/2.1/Win_Waitable_Timer_Object.xsd"},
                VocabularyEntry {"http://cybox.mitre.org/objects#X509CertificateObject-2", "X509CertificateObj", "http://cybox.mitre.org/XMLSchema/objects/X509_Certificate/2.1/X509_Certificate_Object.xsd"},
        };

        constexpr std::array kStixNamespaces {
                VocabularyEntry {"http://data-marking.mitre.org/Marking-1", "marking", "http://stix.mitre.org/XMLSchema/data_marking/1.1.1/data_marking.xsd"},
                VocabularyEntry {"http://data-marking.mitre.org/extensions/MarkingStructure#Simple-1", "simpleMarking", "http://stix.mitre.org/XMLSchema/extensions/marking/simple/1.1.1/simple_marking.xsd"},
                VocabularyEntry {"http://data-marking.mitre.org/extensions/MarkingStructure#TLP-1", "tlpMarking", "http://stix.mitre.org/XMLSchema/extensions/marking/tlp/1.1.1/tlp_marking.xsd"},
                VocabularyEntry {"http://data-marking.mitre.org/extensions/MarkingStructure#Terms_Of_Use-1", "TOUMarking", "http://stix.mitre.org/XMLSchema/extensions/marking/terms_of_use/1.0.1/terms_of_use_marking.xsd"},
                VocabularyEntry {"http://stix.mitre.org/Campaign-1", "campaign", "http://stix.mitre.org/XMLSchema/campaign/1.1.1/campaign.xsd"},
                VocabularyEntry {"http://stix.mitre.org/CourseOfAction-1", "coa", "http://stix.mitre.org/XMLSchema/course_of_action/1.1.1/course_of_action.xsd"},
                VocabularyEntry {"http://stix.mitre.org/ExploitTarget-1", "et", "http://stix.mitre.org/XMLSchema/exploit_target/1.1.1/exploit_target.xsd"},
                VocabularyEntry {"http://stix.mitre.org/Incident-1", "incident", "http://stix.mitre.org/XMLSchema/incident/1.1.1/incident.xsd"},
                VocabularyEntry {"http://stix.mitre.org/Indicator-2", "indicator", "http://stix.mitre.org/XMLSchema/indicator/2.1.1/indicator.xsd"},
                VocabularyEntry {"http://stix.mitre.org/TTP-1", "ttp", "http://stix.mitre.org/XMLSchema/ttp/1.1.1/ttp.xsd"},
                VocabularyEntry {"http://stix.mitre.org/ThreatActor-1", "ta", "http://stix.mitre.org/XMLSchema/threat_actor/1.1.1/threat_actor.xsd"},
                VocabularyEntry {"http://stix.mitre.org/common-1", "stixCommon", "http://stix.mitre.org/XMLSchema/common/1.1.1/stix_common.xsd"},
                VocabularyEntry {"http://stix.mitre.org/default_vocabularies-1", "stixVocabs", "http://stix.mitre.org/XMLSchema/default_vocabularies/1.1.1/stix_default_vocabularies.xsd"},
                VocabularyEntry {"http://stix.mitre.org/extensions/AP#CAPEC2.7-1", "stix-capec", "http://stix.mitre.org/XMLSchema/extensions/attack_pattern/capec_2.7/1.0.1/capec_2.7_attack_pattern.xsd"},
                VocabularyEntry {"http://stix.mitre.org/extensions/Address#CIQAddress3.0-1", "stix-ciqaddress", "http://stix.mitre.org/XMLSchema/extensions/address/ciq_3.0/1.1.1/ciq_3.0_address.xsd"},
                VocabularyEntry {"http://stix.mitre.org/extensions/Identity#CIQIdentity3.0-1", "ciqIdentity", "http://stix.mitre.org/XMLSchema/extensions/identity/ciq_3.0/1.1.1/ciq_3.0_identity.xsd"},
                VocabularyEntry {"http://stix.mitre.org/extensions/Malware#MAEC4.1-1", "stix-maec", "http://stix.mitre.org/XMLSchema/extensions/malware/maec_4.1/1.0.1/maec_4.1_malware.xsd"},
                VocabularyEntry {"http://stix.mitre.org/extensions/StructuredCOA#Generic-1", "genericStructuredCOA", "http://stix.mitre.org/XMLSchema/extensions/structured_coa/generic/1.1.1/generic_structured_coa.xsd"},
                VocabularyEntry {"http://stix.mitre.org/extensions/TestMechanism#Generic-1", "genericTM", "http://stix.mitre.org/XMLSchema/extensions/test_mechanism/generic/1.1.1/generic_test_mechanism.xsd"},
                VocabularyEntry {"http://stix.mitre.org/extensions/TestMechanism#OVAL5.10-1", "stix-oval", "http://stix.mitre.org/XMLSchema/extensions/test_mechanism/oval_5.10/1.1.1/oval_5.10_test_mechanism.xsd"},
                VocabularyEntry {"http://stix.mitre.org/extensions/TestMechanism#OpenIOC2010-1", "stix-openioc", "http://stix.mitre.org/XMLSchema/extensions/test_mechanism/open_ioc_2010/1.1.1/open_ioc_2010_test_mechanism.xsd"},
                VocabularyEntry {"http://stix.mitre.org/extensions/TestMechanism#Snort-1", "snortTM", "http://stix.mitre.org/XMLSchema/extensions/test_mechanism/snort/1.1.1/snort_test_mechanism.xsd"},
                VocabularyEntry {"http://stix.mitre.org/extensions/TestMechanism#YARA-1", "yaraTM", "http://stix.mitre.org/XMLSchema/extensions/test_mechanism/yara/1.1.1/yara_test_mechanism.xsd"},
                VocabularyEntry {"http://stix.mitre.org/extensions/Vulnerability#CVRF-1", "stix-cvrf", "http://stix.mitre.org/XMLSchema/extensions/vulnerability/cvrf_1.1/1.1.1/cvrf_1.1_vulnerability.xsd"},
                VocabularyEntry {"http://stix.mitre.org/stix-1", "stix", "http://stix.mitre.org/XMLSchema/core/1.1.1/stix_core.xsd"},
        };

        // Not defined by STIX, but some of them are hosted on the STIX site.
        constexpr std::array kExtensionNamespaces {
                VocabularyEntry {"http://capec.mitre.org/capec-2", "capec", {}},
                VocabularyEntry {"http://maec.mitre.org/XMLSchema/maec-package-2", "maecPackage", {}},
                VocabularyEntry {"http://oval.mitre.org/XMLSchema/oval-definitions-5", "oval-def", {}},
                VocabularyEntry {"http://oval.mitre.org/XMLSchema/oval-variables-5", "oval-var", {}},
                VocabularyEntry {"http://schemas.mandiant.com/2010/ioc", "ioc", {}},
                VocabularyEntry {"http://schemas.mandiant.com/2010/ioc/TR/", "ioc-tr", {}},
                VocabularyEntry {"http://www.icasi.org/CVRF/schema/cvrf/1.1", "cvrf", {}},
                VocabularyEntry {"urn:oasis:names:tc:ciq:xal:3", "xal", "http://stix.mitre.org/XMLSchema/external/oasis_ciq_3.0/xAL.xsd"},
                VocabularyEntry {"urn:oasis:names:tc:ciq:xpil:3", "xpil", "http://stix.mitre.org/XMLSchema/external/oasis_ciq_3.0/xPIL.xsd"},
                VocabularyEntry {"urn:oasis:names:tc:ciq:xnl:3", "xnl", "http://stix.mitre.org/XMLSchema/external/oasis_ciq_3.0/xNL.xsd"},
        };

        constexpr std::string_view kMaecVocabularyNamespace = "http://maec.mitre.org/default_vocabularies-1";

        constexpr std::array kMaecNamespaces {
                VocabularyEntry {"http://maec.mitre.org/XMLSchema/maec-bundle-4", "maecBundle", "http://maec.mitre.org/language/version4.1/maec_bundle_schema.xsd"},
                VocabularyEntry {"http://maec.mitre.org/XMLSchema/maec-package-2", "maecPackage", "http://maec.mitre.org/language/version4.1/maec_package_schema.xsd"},
                VocabularyEntry {"http://maec.mitre.org/XMLSchema/maec-container-2", "maecContainer", "http://maec.mitre.org/language/version4.1/maec_container_schema.xsd"},
                VocabularyEntry {"http://maec.mitre.org/XMLSchema/mmdef-1", "mmdef", "http://maec.mitre.org/language/version4.1/mmdef_1.2.xsd"},
                VocabularyEntry {kMaecVocabularyNamespace, "maecVocabs", "http://maec.mitre.org/language/version4.1/maec_default_vocabularies.xsd"},
        };

        // Declared in every document.
        constexpr std::array kStixBaseline {
                VocabularyEntry {kXsiNamespace, "xsi", {}},
                VocabularyEntry {"http://stix.mitre.org/stix-1", "stix", {}},
                VocabularyEntry {"http://stix.mitre.org/common-1", "stixCommon", {}},
                VocabularyEntry {"http://stix.mitre.org/default_vocabularies-1", "stixVocabs", {}},
                VocabularyEntry {"http://cybox.mitre.org/cybox-2", "cybox", {}},
                VocabularyEntry {"http://cybox.mitre.org/common-2", "cyboxCommon", {}},
                VocabularyEntry {"http://cybox.mitre.org/default_vocabularies-2", "cyboxVocabs", {}},
        };

        template<class Entries>
        void AddAll(VocabularyTables::Builder& builder, const Entries& entries)
        {
            for (const auto& entry: entries)
                builder.AddNamespace(entry.namespaceUri, entry.prefix, entry.schemaLocation);
        }
    }// namespace

    std::shared_ptr<const VocabularyTables> VocabularyTables::Default()
    {
        static const std::shared_ptr<const VocabularyTables> tables = VocabularyTables::Builder {}
                                                                              .AddCyboxVocabulary()
                                                                              .AddXmlInfrastructure()
                                                                              .AddStixVocabulary()
                                                                              .AddExtensionVocabulary()
                                                                              .AddStixBaseline()
                                                                              .Build();
        return tables;
    }

    std::optional<std::string_view> VocabularyTables::FindPrefix(std::string_view namespaceUri) const noexcept
    {
        const auto it = m_prefixes.find(namespaceUri);
        if (it == m_prefixes.end())
            return std::nullopt;
        return std::string_view {it->second};
    }

    std::optional<std::string_view> VocabularyTables::FindSchemaLocation(std::string_view namespaceUri) const noexcept
    {
        const auto it = m_schemaLocations.find(namespaceUri);
        if (it == m_schemaLocations.end())
            return std::nullopt;
        return std::string_view {it->second};
    }

    bool VocabularyTables::IsWellKnown(std::string_view namespaceUri) const noexcept
    {
        return m_prefixes.find(namespaceUri) != m_prefixes.end();
    }

    bool VocabularyTables::IsXmlInfrastructure(std::string_view namespaceUri) const noexcept
    {
        return m_xmlNamespaces.find(namespaceUri) != m_xmlNamespaces.end();
    }

    VocabularyTables::Builder::Builder(const VocabularyTables& base)
        : m_tables(base)
    {
    }

    VocabularyTables::Builder& VocabularyTables::Builder::AddNamespace(std::string_view namespaceUri,
                                                                       std::string_view prefix,
                                                                       std::string_view schemaLocation)
    {
        m_tables.m_prefixes.insert_or_assign(std::string {namespaceUri}, std::string {prefix});
        if (!schemaLocation.empty())
            AddSchemaLocation(namespaceUri, schemaLocation);
        return *this;
    }

    VocabularyTables::Builder& VocabularyTables::Builder::AddSchemaLocation(std::string_view namespaceUri,
                                                                            std::string_view schemaLocation)
    {
        m_tables.m_schemaLocations.insert_or_assign(std::string {namespaceUri}, std::string {schemaLocation});
        return *this;
    }

    VocabularyTables::Builder& VocabularyTables::Builder::AddXmlNamespace(std::string_view namespaceUri,
                                                                          std::string_view prefix)
    {
        m_tables.m_xmlNamespaces.emplace(namespaceUri);
        return AddNamespace(namespaceUri, prefix);
    }

    VocabularyTables::Builder& VocabularyTables::Builder::AddBaselinePrefix(std::string_view prefix,
                                                                            std::string_view namespaceUri)
    {
        m_tables.m_baseline.insert_or_assign(std::string {prefix}, std::string {namespaceUri});
        return *this;
    }

    VocabularyTables::Builder& VocabularyTables::Builder::RemoveNamespace(std::string_view namespaceUri)
    {
        if (const auto it = m_tables.m_prefixes.find(namespaceUri); it != m_tables.m_prefixes.end())
            m_tables.m_prefixes.erase(it);
        if (const auto it = m_tables.m_schemaLocations.find(namespaceUri); it != m_tables.m_schemaLocations.end())
            m_tables.m_schemaLocations.erase(it);
        if (const auto it = m_tables.m_xmlNamespaces.find(namespaceUri); it != m_tables.m_xmlNamespaces.end())
            m_tables.m_xmlNamespaces.erase(it);
        return *this;
    }

    VocabularyTables::Builder& VocabularyTables::Builder::AddXmlInfrastructure()
    {
        for (const auto& entry: kXmlNamespaces)
            AddXmlNamespace(entry.namespaceUri, entry.prefix);
        return *this;
    }

    VocabularyTables::Builder& VocabularyTables::Builder::AddStixVocabulary()
    {
        AddAll(*this, kStixNamespaces);
        return *this;
    }

    VocabularyTables::Builder& VocabularyTables::Builder::AddCyboxVocabulary()
    {
        AddAll(*this, kCyboxNamespaces);
        return *this;
    }

    VocabularyTables::Builder& VocabularyTables::Builder::AddExtensionVocabulary()
    {
        AddAll(*this, kExtensionNamespaces);
        return *this;
    }

    VocabularyTables::Builder& VocabularyTables::Builder::AddStixBaseline()
    {
        for (const auto& entry: kStixBaseline)
            AddBaselinePrefix(entry.prefix, entry.namespaceUri);
        return *this;
    }

    VocabularyTables::Builder& VocabularyTables::Builder::AddMaecExtension()
    {
        for (const auto& entry: kMaecNamespaces)
        {
            if (entry.namespaceUri == kMaecVocabularyNamespace)
            {
                AddSchemaLocation(entry.namespaceUri, entry.schemaLocation);
                continue;
            }
            AddNamespace(entry.namespaceUri, entry.prefix, entry.schemaLocation);
        }
        return *this;
    }

    std::shared_ptr<const VocabularyTables> VocabularyTables::Builder::Build() const
    {
        return std::shared_ptr<const VocabularyTables>(new VocabularyTables(m_tables));
    }
}// namespace XNS::Namespaces
